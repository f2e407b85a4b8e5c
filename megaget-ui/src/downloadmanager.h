#ifndef DOWNLOADMANAGER_H
#define DOWNLOADMANAGER_H

#include <QObject>
#include <QStringList>
#include <QVariantList>
#include <memory>
#include "appconfig.h"
#include "transferbackend.h"
#include "urlhistory.h"

class SessionState;
class TransferPoller;
class MegaCmdServer;

// QML-facing controller: turns button presses into backend commands and
// exposes the session state (transfers, log, URL history) as properties.

class DownloadManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(QVariantList transfers READ transfers NOTIFY transfersChanged)
    Q_PROPERTY(QString rawListing READ rawListing NOTIFY transfersChanged)
    Q_PROPERTY(bool parseFailed READ parseFailed NOTIFY transfersChanged)
    Q_PROPERTY(QString logText READ logText NOTIFY logChanged)
    Q_PROPERTY(QStringList history READ history NOTIFY historyChanged)
    Q_PROPERTY(bool serverReady READ isServerReady NOTIFY serverReadyChanged)
    Q_PROPERTY(QString downloadDir READ downloadDir CONSTANT)
    Q_PROPERTY(QString modeLabel READ modeLabel CONSTANT)

public:
    static constexpr int RawPreviewLength = 500;

    DownloadManager(const AppConfig& config, std::unique_ptr<TransferBackend> backend,
                    QObject *parent = nullptr);
    ~DownloadManager() override;

    // Real MEGAcmd unless MEGA_SIMULATE or UI_TEST_MODE is set.
    static std::unique_ptr<TransferBackend> createBackend(const AppConfig& config);

    QVariantList transfers() const;
    QString rawListing() const;
    bool parseFailed() const;
    QString logText() const;
    QStringList history() const { return m_history.entries(); }
    bool isServerReady() const { return m_serverReady; }
    QString downloadDir() const { return m_config.downloadDir; }
    QString modeLabel() const;

    SessionState *state() const { return m_state; }
    TransferPoller *poller() const { return m_poller; }

    // Prepares the download dir, waits for the MEGAcmd server and starts polling.
    Q_INVOKABLE void start();

    Q_INVOKABLE void submitUrl(const QString& url);
    Q_INVOKABLE void cancelTransfer(const QString& tag);
    Q_INVOKABLE void pauseTransfer(const QString& tag);
    Q_INVOKABLE void resumeTransfer(const QString& tag);
    Q_INVOKABLE void cancelAll();
    Q_INVOKABLE void pauseAll();
    Q_INVOKABLE void resumeAll();

    Q_INVOKABLE void clearHistory();
    Q_INVOKABLE QString historyEntry(int index) const;

    // Up to 500 characters of the raw listing, for the "could not parse" view.
    Q_INVOKABLE QString rawListingPreview() const;

signals:
    void transfersChanged();
    void logChanged();
    void historyChanged();
    void serverReadyChanged();

private:
    void runAction(TransferAction action, const QString& tag);
    void onServerFinished(bool ready);
    void log(const QString& line);

    AppConfig m_config;
    SessionState *m_state;
    std::unique_ptr<TransferBackend> m_backend;
    TransferPoller *m_poller;
    MegaCmdServer *m_server;
    UrlHistory m_history;
    bool m_serverReady = false;
    bool m_started = false;
};

#endif
