#include "sessionstate.h"

SessionState::SessionState(QObject *parent) : QObject(parent) {}

void SessionState::appendMessage(const QString& line) {
    m_messages.append(line);
    emit messagesChanged();
}

void SessionState::setListing(const QString& raw) {
    m_rawListing = raw;
    m_transfers = TransferParser::parse(raw);
    emit listingChanged();
}

bool SessionState::parseFailed() const {
    return m_transfers.isEmpty() && !m_rawListing.trimmed().isEmpty();
}
