#ifndef TRANSFERPOLLER_H
#define TRANSFERPOLLER_H

#include <QObject>
#include <QTimer>
#include "transferbackend.h"

class SessionState;

// Recurring listing refresh. The next poll is armed only after the previous
// one has answered, so polls never overlap however slow mega-transfers is.
// Failures become log lines; the loop itself never stops on its own.

class TransferPoller : public QObject {
    Q_OBJECT
public:
    static constexpr int MinimumIntervalMs = 500;

    TransferPoller(TransferBackend *backend, SessionState *state, QObject *parent = nullptr);

    void setInterval(int ms);
    int interval() const { return m_intervalMs; }
    void setListingOptions(int limit, int pathDisplaySize);

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // One listing request outside the timer (also used by start()).
    void pollOnce();

    int pollCount() const { return m_pollCount; }
    bool retryingHintShown() const { return m_retryingHintShown; }

    static QString retryingHint();

signals:
    void refreshed();

private:
    void handleResult(const CommandResult& result);

    TransferBackend *m_backend;
    SessionState *m_state;
    QTimer *m_timer;
    int m_intervalMs = MinimumIntervalMs;
    int m_limit = 50;
    int m_pathDisplaySize = 80;
    int m_pollCount = 0;
    bool m_running = false;
    bool m_inFlight = false;
    bool m_retryingHintShown = false;
};

#endif
