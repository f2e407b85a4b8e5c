#include "transferpoller.h"
#include "sessionstate.h"
#include <QPointer>
#include <QDebug>
#include <algorithm>

TransferPoller::TransferPoller(TransferBackend *backend, SessionState *state, QObject *parent)
    : QObject(parent), m_backend(backend), m_state(state) {
    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &TransferPoller::pollOnce);
}

QString TransferPoller::retryingHint() {
    return QString::fromUtf8("⚠ If transfers stay at 0% (RETRYING), try Resume, or Cancel and re-add the URL.");
}

void TransferPoller::setInterval(int ms) {
    m_intervalMs = std::max(MinimumIntervalMs, ms);
}

void TransferPoller::setListingOptions(int limit, int pathDisplaySize) {
    m_limit = limit;
    m_pathDisplaySize = pathDisplaySize;
}

void TransferPoller::start() {
    if (m_running) return;
    m_running = true;
    qDebug() << "Polling" << m_backend->name() << "every" << m_intervalMs << "ms";
    pollOnce();
}

void TransferPoller::stop() {
    m_running = false;
    m_timer->stop();
}

void TransferPoller::pollOnce() {
    if (m_inFlight) return;
    m_inFlight = true;

    QPointer<TransferPoller> self(this);
    m_backend->listTransfers(m_limit, m_pathDisplaySize, [self](const CommandResult& result) {
        if (self) self->handleResult(result);
    });
}

void TransferPoller::handleResult(const CommandResult& result) {
    m_inFlight = false;
    ++m_pollCount;

    if (!result.started) {
        m_state->appendMessage("Poll error: " + result.errorString);
    } else {
        m_state->setListing(result.stdOut);

        // Known MEGAcmd behaviour: new transfers can sit at 0% in RETRYING.
        // Say so once per run, not on every poll that still shows it.
        if (!m_retryingHintShown && result.stdOut.contains("RETRYING")) {
            m_retryingHintShown = true;
            m_state->appendMessage(retryingHint());
        }

        if (m_pollCount <= 5 || m_pollCount % 10 == 0) {
            qDebug() << "Poll" << m_pollCount << "complete:"
                     << m_state->transfers().size() << "transfers";
        }
    }

    emit refreshed();

    if (m_running) m_timer->start(m_intervalMs);
}
