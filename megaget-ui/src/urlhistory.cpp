#include "urlhistory.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

UrlHistory::UrlHistory(const QString& filePath, int maxEntries)
    : m_filePath(filePath), m_maxEntries(maxEntries > 0 ? maxEntries : DefaultMaxEntries) {}

bool UrlHistory::load() {
    m_entries.clear();
    if (m_filePath.isEmpty() || !QFile::exists(m_filePath)) return false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Could not read URL history:" << m_filePath;
        return false;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "Ignoring malformed URL history" << m_filePath << ":" << error.errorString();
        return false;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue& value : array) {
        if (!value.isString()) continue;
        m_entries.append(value.toString());
        if (m_entries.size() >= m_maxEntries) break;
    }
    return true;
}

bool UrlHistory::save() const {
    if (m_filePath.isEmpty()) return false;

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Could not write URL history:" << m_filePath << file.errorString();
        return false;
    }

    QJsonArray array;
    for (const QString& url : m_entries.mid(0, m_maxEntries)) {
        array.append(url);
    }
    if (file.write(QJsonDocument(array).toJson(QJsonDocument::Compact)) < 0) {
        qWarning() << "Could not write URL history:" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

bool UrlHistory::add(const QString& url) {
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) return false;

    m_entries.removeAll(trimmed);
    m_entries.prepend(trimmed);
    while (m_entries.size() > m_maxEntries) {
        m_entries.removeLast();
    }
    return save();
}

bool UrlHistory::clear() {
    m_entries.clear();
    return save();
}
