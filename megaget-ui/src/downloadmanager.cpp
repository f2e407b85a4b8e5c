#include "downloadmanager.h"
#include "sessionstate.h"
#include "transferpoller.h"
#include "megacmdserver.h"
#include "backends/megacmdbackend.h"
#include "backends/simulatedbackend.h"
#include "backends/sampledatabackend.h"
#include <QDir>
#include <QFileInfo>
#include <QPointer>
#include <QVariantMap>
#include <QDebug>
#include <utility>

DownloadManager::DownloadManager(const AppConfig& config, std::unique_ptr<TransferBackend> backend,
                                 QObject *parent)
    : QObject(parent),
      m_config(config),
      m_state(new SessionState(this)),
      m_backend(std::move(backend)),
      m_history(config.historyFilePath()) {
    m_poller = new TransferPoller(m_backend.get(), m_state, this);
    m_poller->setInterval(m_config.pollIntervalMs());
    m_poller->setListingOptions(m_config.transferListLimit, m_config.pathDisplaySize);

    m_server = new MegaCmdServer(m_config, this);
    connect(m_server, &MegaCmdServer::finished, this, &DownloadManager::onServerFinished);

    connect(m_state, &SessionState::messagesChanged, this, &DownloadManager::logChanged);
    connect(m_state, &SessionState::listingChanged, this, &DownloadManager::transfersChanged);

    if (!m_history.load()) {
        qDebug() << "Starting with empty URL history" << m_history.filePath();
    }
}

DownloadManager::~DownloadManager() {
    m_poller->stop();
}

std::unique_ptr<TransferBackend> DownloadManager::createBackend(const AppConfig& config) {
    if (config.simulate) {
        return std::make_unique<SimulatedBackend>();
    }
    if (config.uiTestMode) {
        return std::make_unique<SampleDataBackend>();
    }
    return std::make_unique<MegaCmdBackend>(config.subprocessEnvironment());
}

QVariantList DownloadManager::transfers() const {
    QVariantList list;
    for (const Transfer& t : m_state->transfers()) {
        list.append(t.toVariantMap());
    }
    return list;
}

QString DownloadManager::rawListing() const {
    return m_state->rawListing();
}

bool DownloadManager::parseFailed() const {
    return m_state->parseFailed();
}

QString DownloadManager::rawListingPreview() const {
    const QString raw = m_state->rawListing();
    if (raw.size() > RawPreviewLength) {
        return raw.left(RawPreviewLength) + "...";
    }
    return raw;
}

QString DownloadManager::logText() const {
    if (m_state->messages().isEmpty()) return "Ready to download...";
    return m_state->messages().join('\n');
}

QString DownloadManager::modeLabel() const {
    return m_backend->name();
}

void DownloadManager::log(const QString& line) {
    qInfo() << "[ui]" << line;
    m_state->appendMessage(line);
}

void DownloadManager::start() {
    if (m_started) return;
    m_started = true;

    if (!QDir().mkpath(m_config.downloadDir)) {
        qWarning() << "Could not create download directory" << m_config.downloadDir;
        log(QString::fromUtf8("⚠ Could not create download directory: ") + m_config.downloadDir);
    }

    if (!m_config.simulate && !m_config.uiTestMode) {
        log(QString::fromUtf8("⏳ Initializing MEGAcmd..."));
    }
    if (m_config.uiTestMode) {
        log(QString::fromUtf8("🧪 UI TEST MODE - Showing sample transfers for development"));
        log(QString::fromUtf8("ℹ Set UI_TEST_MODE=0 or remove env var to use real MEGAcmd"));
    }

    qInfo() << "Run mode:" << AppConfig::runModeName(m_config.runMode)
            << "backend:" << m_backend->name()
            << "download dir:" << QFileInfo(m_config.downloadDir).absoluteFilePath()
            << "writable:" << QFileInfo(m_config.downloadDir).isWritable()
            << "MEGACMD_PATH:" << (m_config.megaCmdPath.isEmpty() ? QStringLiteral("(none)") : m_config.megaCmdPath)
            << "mega-get:" << AppConfig::findExecutable("mega-get", m_config.subprocessEnvironment());

    m_server->ensureRunning();
}

void DownloadManager::onServerFinished(bool ready) {
    m_serverReady = ready;
    emit serverReadyChanged();

    if (!ready) {
        log(QString::fromUtf8("⚠ MEGAcmd server not detected. Start MEGAcmd (mega-cmd-server), then restart this app."));
    } else if (!m_config.uiTestMode) {
        log(QString::fromUtf8("✓ MEGAcmd ready. Downloads will be saved to: ") + m_config.downloadDir);
    }
    if (m_config.simulate) {
        log(QString::fromUtf8("ℹ Simulation mode (MEGA_SIMULATE=1) - no MEGA CMD required."));
    }

    m_poller->start();
}

void DownloadManager::submitUrl(const QString& url) {
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) {
        log(QString::fromUtf8("⚠ Please enter a MEGA URL"));
        return;
    }

    if (!m_history.add(trimmed)) {
        qWarning() << "URL history was not saved";
    }
    emit historyChanged();

    log("Starting download to " + m_config.downloadDir + "...");

    QPointer<DownloadManager> self(this);
    m_backend->startDownload(trimmed, m_config.downloadDir, [self](const CommandResult& result) {
        if (!self) return;
        if (!result.started) {
            self->log(QString::fromUtf8("✗ Error: ") + result.errorString);
            return;
        }
        const QString out = result.stdOut.trimmed();
        if (!out.isEmpty()) self->log(out);

        if (result.exitCode == 0) {
            self->log(QString::fromUtf8("✓ Download started successfully"));
        } else {
            self->log(QString::fromUtf8("✗ Error: Unable to parse MEGA URL"));
            const QString err = result.stdErr.trimmed();
            if (!err.isEmpty()) self->log("Details: " + err);
        }
    });
}

void DownloadManager::runAction(TransferAction action, const QString& tag) {
    const QString target = tag.trimmed();
    const QString label = target.isEmpty() ? QStringLiteral("all") : target;

    QPointer<DownloadManager> self(this);
    m_backend->transferAction(action, target, [self, action, label](const CommandResult& result) {
        if (!self) return;
        if (!result.started) {
            self->log(QString::fromUtf8("✗ ") + transferActionTitle(action) + " failed: " + result.errorString);
            return;
        }
        const QString out = result.stdOut.trimmed();
        const QString err = result.stdErr.trimmed();
        if (!out.isEmpty()) self->log(out);
        if (!err.isEmpty() && result.exitCode != 0) {
            self->log(err);
        } else {
            self->log(transferActionTitle(action) + " command sent for transfer " + label);
        }
    });
}

void DownloadManager::cancelTransfer(const QString& tag) { runAction(TransferAction::Cancel, tag); }
void DownloadManager::pauseTransfer(const QString& tag)  { runAction(TransferAction::Pause, tag); }
void DownloadManager::resumeTransfer(const QString& tag) { runAction(TransferAction::Resume, tag); }
void DownloadManager::cancelAll() { runAction(TransferAction::Cancel, QString()); }
void DownloadManager::pauseAll()  { runAction(TransferAction::Pause, QString()); }
void DownloadManager::resumeAll() { runAction(TransferAction::Resume, QString()); }

void DownloadManager::clearHistory() {
    if (!m_history.clear()) {
        qWarning() << "URL history was not saved";
    }
    emit historyChanged();
}

QString DownloadManager::historyEntry(int index) const {
    const QStringList entries = m_history.entries();
    if (index < 0 || index >= entries.size()) return QString();
    return entries.at(index);
}
