#include "transferparser.h"
#include <QRegularExpression>
#include <QList>
#include <QStringList>
#include <QtGlobal>
#include <QDebug>

Transfer::State Transfer::knownState() const {
    if (state == "ACTIVE")    return State::Active;
    if (state == "PAUSED")    return State::Paused;
    if (state == "QUEUED")    return State::Queued;
    if (state == "RETRYING")  return State::Retrying;
    if (state == "COMPLETED") return State::Completed;
    if (state == "FAILED")    return State::Failed;
    return State::Other;
}

QString Transfer::progressText() const {
    QString text = QString::number(static_cast<int>(progressPercent)) + "%";
    if (sizeDisplay != TransferParser::UnknownSize) {
        text += " of " + sizeDisplay;
    }
    return text;
}

QVariantMap Transfer::toVariantMap() const {
    QVariantMap map;
    map["tag"] = tag;
    map["state"] = state;
    map["progress"] = progressPercent / 100.0;
    map["progressPercent"] = progressPercent;
    map["progressText"] = progressText();
    map["path"] = path;
    map["filename"] = filename;
    map["sizeDisplay"] = sizeDisplay;
    switch (direction) {
    case Direction::Download: map["direction"] = "download"; break;
    case Direction::Upload:   map["direction"] = "upload"; break;
    case Direction::Unknown:  map["direction"] = QString(); break;
    }
    return map;
}

bool Transfer::operator==(const Transfer& other) const {
    return tag == other.tag && state == other.state &&
           qFuzzyCompare(progressPercent + 1.0, other.progressPercent + 1.0) &&
           path == other.path && filename == other.filename &&
           sizeDisplay == other.sizeDisplay && direction == other.direction;
}

bool TransferParser::isHeaderLine(const QString& line) {
    // mega-transfers prints "TYPE  TAG  SOURCEPATH  DESTINYPATH  PROGRESS  STATE"
    return line.contains("TYPE") && line.contains("TAG") && line.contains("STATE");
}

QString TransferParser::elideFilename(const QString& filename) {
    // Counted in code points so a surrogate pair is never split.
    const QList<uint> codePoints = filename.toUcs4();
    if (codePoints.size() > MaxFilenameLength) {
        return QString::fromUcs4(reinterpret_cast<const char32_t *>(codePoints.constData()),
                                 MaxFilenameLength - 3) + "...";
    }
    return filename;
}

QString TransferParser::filenameFromPath(const QString& path) {
    const QString trimmed = path.trimmed();
    QString filename = trimmed.contains('/') ? trimmed.section('/', -1).trimmed() : trimmed;

    // --path-display-size shortens long paths as "/first/par...t/file.ext".
    // The untruncated prefix would give the wrong segment.
    if (trimmed.contains("...") && trimmed.contains('/')) {
        const QString tail = trimmed.section("...", -1);
        if (tail.contains('/')) {
            filename = tail.section('/', -1).trimmed();
        }
    }
    return filename;
}

QVector<Transfer> TransferParser::parse(const QString& raw) {
    QVector<Transfer> result;
    if (raw.trimmed().isEmpty()) return result;

    static const QRegularExpression simplifiedRe(
        "^\\s*(\\d+)\\s+(\\w+)\\s+(\\d+)%\\s+(.+)$");

    // Download glyphs: ⇓ (U+21D3) and ↓ (U+2193). Upload: ⇑ (U+21D1), ↑ (U+2191).
    static const QRegularExpression nativeRe(
        "([\\x{21D3}\\x{2193}\\x{21D1}\\x{2191}])\\s+(\\d+)\\s+(.*?)\\s+"
        "(\\d+(?:\\.\\d+)?)\\s*%\\s+of\\s+([\\d.]+)\\s*([KMGT]?B)\\s+(\\w+)\\s*$");

    const QStringList lines = raw.trimmed().split('\n');
    for (int lineNum = 0; lineNum < lines.size(); ++lineNum) {
        const QString line = lines.at(lineNum).trimmed();
        if (line.isEmpty()) continue;
        if (isHeaderLine(line)) continue;

        auto simple = simplifiedRe.match(line);
        if (simple.hasMatch()) {
            Transfer t;
            t.tag = simple.captured(1);
            t.state = simple.captured(2);
            t.progressPercent = qBound(0.0, simple.captured(3).toDouble(), 100.0);
            t.path = simple.captured(4).trimmed();
            t.filename = elideFilename(filenameFromPath(t.path));
            if (t.filename.isEmpty()) t.filename = QStringLiteral("Unknown");
            t.sizeDisplay = UnknownSize;
            result.append(t);
            continue;
        }

        auto native = nativeRe.match(line);
        if (native.hasMatch()) {
            const QChar glyph = native.captured(1).at(0);
            Transfer t;
            t.direction = (glyph == QChar(0x21D3) || glyph == QChar(0x2193))
                ? Transfer::Direction::Download
                : Transfer::Direction::Upload;
            t.tag = native.captured(2);
            t.path = native.captured(3).trimmed();
            t.progressPercent = qBound(0.0, native.captured(4).toDouble(), 100.0);
            t.sizeDisplay = native.captured(5) + " " + native.captured(6);
            t.state = native.captured(7);
            t.filename = elideFilename(filenameFromPath(t.path));
            if (t.filename.isEmpty()) t.filename = QStringLiteral("Unknown");
            result.append(t);

            qDebug() << "[parser] transfer" << t.tag << t.filename << t.progressPercent
                     << t.state << t.sizeDisplay;
            continue;
        }

        if (line.size() > 10) {
            qDebug() << "[parser] unparsed line" << lineNum << ":" << line.left(200);
        }
    }
    return result;
}
