#ifndef URLHISTORY_H
#define URLHISTORY_H

#include <QString>
#include <QStringList>

// Recently submitted URLs, newest first, stored as a flat JSON array.
// Re-submitting a URL moves it to the front instead of duplicating it.

class UrlHistory {
public:
    static constexpr int DefaultMaxEntries = 50;

    explicit UrlHistory(const QString& filePath, int maxEntries = DefaultMaxEntries);

    bool load();
    bool save() const;

    // Both persist immediately and return false when the file could not be
    // written. Blank URLs are not recorded.
    bool add(const QString& url);
    bool clear();

    QStringList entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    int maxEntries() const { return m_maxEntries; }
    QString filePath() const { return m_filePath; }

private:
    QString m_filePath;
    int m_maxEntries;
    QStringList m_entries;
};

#endif
