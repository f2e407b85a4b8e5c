#ifndef SESSIONSTATE_H
#define SESSIONSTATE_H

#include <QObject>
#include <QStringList>
#include <QVector>
#include "transferparser.h"

// What the UI shows: the message log and the latest transfer listing.
// Written by the poller (listing, advisories) and by user actions (log
// lines); read by DownloadManager. Lives on the GUI thread only.

class SessionState : public QObject {
    Q_OBJECT
public:
    explicit SessionState(QObject *parent = nullptr);

    const QStringList& messages() const { return m_messages; }
    void appendMessage(const QString& line);

    QString rawListing() const { return m_rawListing; }
    const QVector<Transfer>& transfers() const { return m_transfers; }

    // Replaces the listing wholesale and re-parses it.
    void setListing(const QString& raw);

    // Output arrived but none of it was recognisable as a transfer row.
    bool parseFailed() const;

signals:
    void messagesChanged();
    void listingChanged();

private:
    QStringList m_messages;
    QString m_rawListing;
    QVector<Transfer> m_transfers;
};

#endif
