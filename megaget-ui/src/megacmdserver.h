#ifndef MEGACMDSERVER_H
#define MEGACMDSERVER_H

#include <QObject>
#include <QElapsedTimer>
#include "appconfig.h"

class QProcess;

// Brings up the MEGAcmd background server for desktop runs.
//
// mega-get / mega-transfers only talk to a running mega-cmd-server. In a
// container the entrypoint starts it; on a desktop we start it ourselves
// (Linux ships a headless mega-cmd-server, the macOS bundle does not and
// has to be opened by the user) and then run `mega-version` until it
// answers or the overall deadline passes.

class MegaCmdServer : public QObject {
    Q_OBJECT
public:
    static constexpr int DefaultStartupDelayMs = 2000;
    static constexpr int DefaultAttemptTimeoutMs = 5000;
    static constexpr int DefaultRetryDelayMs = 1000;
    static constexpr int DefaultOverallTimeoutMs = 15000;

    explicit MegaCmdServer(const AppConfig& config, QObject *parent = nullptr);
    ~MegaCmdServer() override;

    void setTimings(int startupDelayMs, int attemptTimeoutMs, int retryDelayMs, int overallTimeoutMs);

    // Asynchronous; emits finished() when the check completes. Ignored while
    // a check is already running.
    void ensureRunning();

    bool isReady() const { return m_ready; }
    bool isChecking() const { return m_checking; }

    // "mega-cmd-server" when the headless server is on the augmented PATH,
    // the MEGAcmd app binary on macOS, empty when neither is found.
    QString serverBinary() const;

signals:
    void finished(bool ready);

private:
    void startServer();
    void probe();
    void retryLater();
    void finish(bool ready);

    AppConfig m_config;
    QProcess *m_probe = nullptr;
    QElapsedTimer m_elapsed;
    int m_startupDelayMs = DefaultStartupDelayMs;
    int m_attemptTimeoutMs = DefaultAttemptTimeoutMs;
    int m_retryDelayMs = DefaultRetryDelayMs;
    int m_overallTimeoutMs = DefaultOverallTimeoutMs;
    int m_attempts = 0;
    bool m_ready = false;
    bool m_checking = false;
};

#endif
