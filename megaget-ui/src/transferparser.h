#ifndef TRANSFERPARSER_H
#define TRANSFERPARSER_H

#include <QString>
#include <QVariantMap>
#include <QVector>

// One row of `mega-transfers` output. Rebuilt from scratch on every poll,
// so nothing here has an identity beyond the tag the tool reports.
struct Transfer {
    enum class Direction { Unknown, Download, Upload };
    enum class State { Active, Paused, Queued, Retrying, Completed, Failed, Other };

    QString tag;
    QString state;              // verbatim from the tool, e.g. "ACTIVE"
    double progressPercent = 0.0;
    QString path;
    QString filename;
    QString sizeDisplay;        // "455.34 MB" or "Unknown"
    Direction direction = Direction::Unknown;

    State knownState() const;
    // "45%" or "45% of 3.54 GB"
    QString progressText() const;
    QVariantMap toVariantMap() const;

    bool operator==(const Transfer& other) const;
    bool operator!=(const Transfer& other) const { return !(*this == other); }
};

// Turns the free-form console listing of `mega-transfers` into Transfer
// records. Two line shapes are understood:
//
//   simplified:  "1         ACTIVE    12%       /data/sample_file.zip"
//   native:      "⇓    76  /path/to/file.mkv  5.42% of  455.34 MB ACTIVE"
//
// Header rows, blank lines and anything else are skipped. Never fails.
class TransferParser {
public:
    static constexpr int MaxFilenameLength = 60;
    static inline const QString UnknownSize = QStringLiteral("Unknown");

    static QVector<Transfer> parse(const QString& raw);

    // Last '/' segment of a path. When the tool shortened the middle of the
    // path with "...", the segment is taken from the text after the marker.
    static QString filenameFromPath(const QString& path);

private:
    static bool isHeaderLine(const QString& line);
    static QString elideFilename(const QString& filename);
};

#endif
