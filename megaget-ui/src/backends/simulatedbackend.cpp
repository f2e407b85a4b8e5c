#include "simulatedbackend.h"
#include <QTimer>
#include <utility>

SimulatedBackend::SimulatedBackend(QObject *parent) : QObject(parent) {}

QString SimulatedBackend::cannedListing() {
    return "\n"
           "TRANSFER  STATE     PROGRESS  PATH\n"
           "1         ACTIVE    12%       /data/sample_file.zip\n"
           "2         QUEUED    0%        /data/another_file.pdf\n";
}

void SimulatedBackend::reply(int delayMs, const CommandResult& result, Callback done) {
    QTimer::singleShot(delayMs, this, [result, done]() {
        if (done) done(result);
    });
}

void SimulatedBackend::startDownload(const QString& url, const QString& downloadDir, Callback done) {
    Q_UNUSED(url);
    Q_UNUSED(downloadDir);
    CommandResult result;
    result.started = true;
    result.exitCode = 0;
    result.stdOut = "URL Accepted (simulated)";
    reply(m_acceptDelayMs, result, std::move(done));
}

void SimulatedBackend::transferAction(TransferAction action, const QString& tag, Callback done) {
    CommandResult result;
    result.started = true;
    result.exitCode = 0;
    result.stdOut = transferActionTitle(action) + " transfer " + (tag.isEmpty() ? QStringLiteral("all") : tag);
    reply(0, result, std::move(done));
}

void SimulatedBackend::listTransfers(int limit, int pathDisplaySize, Callback done) {
    Q_UNUSED(limit);
    Q_UNUSED(pathDisplaySize);
    CommandResult result;
    result.started = true;
    result.exitCode = 0;
    result.stdOut = cannedListing();
    reply(0, result, std::move(done));
}
