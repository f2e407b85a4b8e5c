#include "megacmdserver.h"
#include <QFileInfo>
#include <QProcess>
#include <QTimer>
#include <QDebug>

MegaCmdServer::MegaCmdServer(const AppConfig& config, QObject *parent)
    : QObject(parent), m_config(config) {}

MegaCmdServer::~MegaCmdServer() {
    if (m_probe) {
        m_probe->disconnect(this);
        if (m_probe->state() != QProcess::NotRunning) {
            m_probe->kill();
            m_probe->waitForFinished(1000);
        }
    }
}

void MegaCmdServer::setTimings(int startupDelayMs, int attemptTimeoutMs, int retryDelayMs, int overallTimeoutMs) {
    m_startupDelayMs = startupDelayMs;
    m_attemptTimeoutMs = attemptTimeoutMs;
    m_retryDelayMs = retryDelayMs;
    m_overallTimeoutMs = overallTimeoutMs;
}

QString MegaCmdServer::serverBinary() const {
    const QProcessEnvironment env = m_config.subprocessEnvironment();
    if (!AppConfig::findExecutable("mega-cmd-server", env).isEmpty()) {
        return "mega-cmd-server";
    }
#ifdef Q_OS_MACOS
    if (!m_config.megaCmdPath.isEmpty()) {
        QFileInfo app(m_config.megaCmdPath + "/MEGAcmd");
        if (app.isFile() && app.isExecutable()) return app.filePath();
    }
#endif
    return QString();
}

void MegaCmdServer::ensureRunning() {
    if (m_checking) return;
    m_checking = true;
    m_attempts = 0;

    // Containers start the server from their entrypoint; simulated runs
    // never talk to it.
    if (m_config.inContainer || m_config.simulate || m_config.uiTestMode) {
        QTimer::singleShot(0, this, [this]() { finish(true); });
        return;
    }

    // Only the headless Linux server is started here. Launching the macOS
    // MEGAcmd app would pop up its own window.
    if (serverBinary() == "mega-cmd-server") {
        startServer();
        QTimer::singleShot(m_startupDelayMs, this, [this]() {
            m_elapsed.start();
            probe();
        });
    } else {
        qDebug() << "mega-cmd-server not found, waiting for an already running server";
        m_elapsed.start();
        QTimer::singleShot(0, this, &MegaCmdServer::probe);
    }
}

void MegaCmdServer::startServer() {
    const QProcessEnvironment env = m_config.subprocessEnvironment();

    QProcess launcher;
    launcher.setProgram(AppConfig::findExecutable("mega-cmd-server", env));
    launcher.setProcessEnvironment(env);
    launcher.setStandardInputFile(QProcess::nullDevice());
    launcher.setStandardOutputFile(QProcess::nullDevice());
    launcher.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = 0;
    if (launcher.startDetached(&pid)) {
        qInfo() << "Started mega-cmd-server, pid" << pid;
    } else {
        qWarning() << "Failed to start mega-cmd-server:" << launcher.errorString();
    }
}

void MegaCmdServer::probe() {
    if (m_elapsed.elapsed() >= m_overallTimeoutMs) {
        finish(false);
        return;
    }
    ++m_attempts;

    const QProcessEnvironment env = m_config.subprocessEnvironment();
    const QString binary = AppConfig::findExecutable("mega-version", env);
    if (binary.isEmpty()) {
        qDebug() << "mega-version not found on PATH (attempt" << m_attempts << ")";
        retryLater();
        return;
    }

    QProcess *proc = new QProcess(this);
    m_probe = proc;
    proc->setProcessEnvironment(env);
    proc->setStandardOutputFile(QProcess::nullDevice());
    proc->setStandardErrorFile(QProcess::nullDevice());

    // Per-attempt timeout: a server that is still binding its socket can
    // leave mega-version hanging.
    QTimer *attemptTimer = new QTimer(proc);
    attemptTimer->setSingleShot(true);
    connect(attemptTimer, &QTimer::timeout, proc, [proc]() {
        if (proc->state() != QProcess::NotRunning) {
            qDebug() << "mega-version timed out, killing it";
            proc->kill();
        }
    });

    connect(proc, &QProcess::errorOccurred, this, [this, proc](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        qDebug() << "mega-version failed to start:" << proc->errorString();
        m_probe = nullptr;
        proc->deleteLater();
        retryLater();
    });

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, proc](int exitCode, QProcess::ExitStatus status) {
        m_probe = nullptr;
        proc->deleteLater();
        if (status == QProcess::NormalExit && exitCode == 0) {
            finish(true);
        } else {
            qDebug() << "mega-version attempt" << m_attempts << "exited with" << exitCode;
            retryLater();
        }
    });

    proc->start(binary, QStringList());
    attemptTimer->start(m_attemptTimeoutMs);
}

void MegaCmdServer::retryLater() {
    QTimer::singleShot(m_retryDelayMs, this, &MegaCmdServer::probe);
}

void MegaCmdServer::finish(bool ready) {
    m_checking = false;
    m_ready = ready;
    qInfo() << "MEGAcmd server ready:" << ready << "after" << m_attempts << "attempt(s)";
    emit finished(ready);
}
