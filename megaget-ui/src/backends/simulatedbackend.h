#ifndef SIMULATEDBACKEND_H
#define SIMULATEDBACKEND_H

#include "../transferbackend.h"
#include <QObject>

// MEGA_SIMULATE=1: no process is ever created. Downloads are "accepted"
// after a short delay, actions always succeed and the listing is a fixed
// two-row table in the simplified format.

class SimulatedBackend : public QObject, public TransferBackend {
    Q_OBJECT
public:
    static constexpr int DefaultAcceptDelayMs = 1000;

    explicit SimulatedBackend(QObject *parent = nullptr);

    QString name() const override { return "simulated"; }
    bool isSimulated() const override { return true; }

    void startDownload(const QString& url, const QString& downloadDir, Callback done) override;
    void transferAction(TransferAction action, const QString& tag, Callback done) override;
    void listTransfers(int limit, int pathDisplaySize, Callback done) override;

    void setAcceptDelay(int ms) { m_acceptDelayMs = ms; }

    static QString cannedListing();

protected:
    void reply(int delayMs, const CommandResult& result, Callback done);

private:
    int m_acceptDelayMs = DefaultAcceptDelayMs;
};

#endif
