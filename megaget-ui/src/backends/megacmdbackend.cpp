#include "megacmdbackend.h"
#include "../appconfig.h"
#include <QDir>
#include <QProcess>
#include <QTimer>
#include <QDebug>
#include <utility>

MegaCmdBackend::MegaCmdBackend(const QProcessEnvironment& env, QObject *parent)
    : QObject(parent), m_env(env) {}

MegaCmdBackend::~MegaCmdBackend() {
    // Drop completion handlers first so nothing calls back into owners that
    // are already being torn down, then make sure no mega-* child outlives us.
    const auto processes = findChildren<QProcess*>();
    for (QProcess *proc : processes) {
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
    }
}

void MegaCmdBackend::runCommand(const QString& program, const QStringList& args, Callback done) {
    const QString binary = AppConfig::findExecutable(program, m_env);
    if (binary.isEmpty()) {
        CommandResult result;
        result.errorString = program + ": command not found";
        qWarning() << "[megacmd]" << result.errorString;
        QTimer::singleShot(0, this, [done, result]() {
            if (done) done(result);
        });
        return;
    }

    QProcess *proc = new QProcess(this);
    proc->setProcessEnvironment(m_env);

    connect(proc, &QProcess::errorOccurred, this, [proc, program, done](QProcess::ProcessError error) {
        // Crashes still emit finished(); only a failed start ends here.
        if (error != QProcess::FailedToStart) return;
        CommandResult result;
        result.errorString = proc->errorString();
        qWarning() << "[megacmd] failed to start" << program << ":" << result.errorString;
        proc->deleteLater();
        if (done) done(result);
    });

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [proc, program, done](int exitCode, QProcess::ExitStatus status) {
        CommandResult result;
        result.started = true;
        result.exitCode = (status == QProcess::NormalExit) ? exitCode : -1;
        result.stdOut = QString::fromUtf8(proc->readAllStandardOutput());
        result.stdErr = QString::fromUtf8(proc->readAllStandardError());
        if (status != QProcess::NormalExit) {
            result.errorString = proc->errorString();
        }
        qDebug() << "[megacmd]" << program << "exited with" << result.exitCode
                 << "stdout:" << result.stdOut.size() << "bytes, stderr:" << result.stdErr.trimmed().left(300);
        proc->deleteLater();
        if (done) done(result);
    });

    qDebug() << "[megacmd] running" << binary << args;
    proc->start(binary, args);
}

void MegaCmdBackend::startDownload(const QString& url, const QString& downloadDir, Callback done) {
    const QString target = QDir(downloadDir).absolutePath();
    QStringList args;
    args << "-q" << "--ignore-quota-warn" << url.trimmed() << target;

    qDebug() << "[megacmd] mega-get" << url.trimmed().left(80) << "->" << target;
    runCommand("mega-get", args, [this, done](const CommandResult& result) {
        if (done) done(result);
        // Freshly queued transfers sometimes sit at 0% in RETRYING until
        // they are explicitly resumed.
        if (result.succeeded()) scheduleResumeAll();
    });
}

void MegaCmdBackend::scheduleResumeAll() {
    QTimer::singleShot(m_resumeDelayMs, this, [this]() {
        runCommand("mega-transfers", QStringList() << "-r" << "-a", [](const CommandResult& result) {
            if (!result.succeeded()) {
                qDebug() << "[megacmd] resume-all after mega-get failed:"
                         << (result.started ? result.stdErr.trimmed() : result.errorString);
            }
        });
    });
}

void MegaCmdBackend::transferAction(TransferAction action, const QString& tag, Callback done) {
    QString flag;
    switch (action) {
    case TransferAction::Cancel: flag = "-c"; break;
    case TransferAction::Pause:  flag = "-p"; break;
    case TransferAction::Resume: flag = "-r"; break;
    }
    const QString target = tag.trimmed().isEmpty() ? QStringLiteral("-a") : tag.trimmed();
    runCommand("mega-transfers", QStringList() << flag << target, std::move(done));
}

void MegaCmdBackend::listTransfers(int limit, int pathDisplaySize, Callback done) {
    QStringList args;
    args << QString("--limit=%1").arg(limit)
         << QString("--path-display-size=%1").arg(pathDisplaySize);

    runCommand("mega-transfers", args, [done](const CommandResult& result) {
        CommandResult listing = result;
        if (listing.started && listing.exitCode != 0 && !listing.stdErr.isEmpty()) {
            listing.stdOut += listing.stdErr;
        }
        qDebug() << "[megacmd] listing:" << listing.stdOut;
        if (done) done(listing);
    });
}
