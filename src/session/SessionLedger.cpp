#include "session/SessionLedger.h"
#include "core/Logging.h"

#include <QUuid>

#include <algorithm>

int SessionLimits::clamp(std::optional<int> requestedMinutes) const {
    const int requested = requestedMinutes.value_or(0) != 0 ? *requestedMinutes : defaultMinutes;
    return std::clamp(requested, minMinutes, std::max(minMinutes, maxMinutes));
}

SessionLedger::SessionLedger(SessionStore &store, const Clock &clock, const SessionLimits &limits)
    : store_(store), clock_(clock), limits_(limits) {}

Session SessionLedger::create(const QString &questionName, std::optional<int> durationMinutes) {
    Session session;
    session.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    session.questionName = questionName;
    session.startedAt = clock_.now();
    session.durationMinutes = limits_.clamp(durationMinutes);
    while (!store_.create(session)) {
        session.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    qCInfo(lcSession) << "Started session" << session.id << "for" << questionName
                      << "lasting" << session.durationMinutes << "minutes";
    return session;
}

int SessionLedger::remainingSeconds(const Session &session) const {
    const qint64 remainingMs = clock_.now().msecsTo(session.expiresAt());
    return static_cast<int>(std::max<qint64>(0, remainingMs / 1000));
}

void SessionLedger::expireIfDue(Session &session) const {
    if (session.status == SessionStatus::Active && remainingSeconds(session) <= 0) {
        session.status = SessionStatus::Expired;
        qCInfo(lcSession) << "Session" << session.id << "expired";
    }
}

std::optional<Session> SessionLedger::get(const QString &sessionId, EngineError *errorOut) {
    const std::optional<Session> session = store_.mutate(sessionId, [this](Session &s) {
        expireIfDue(s);
    });
    if (!session) {
        setError(errorOut, EngineError::Kind::NotFound, "Session not found");
    }
    return session;
}

bool SessionLedger::markScore(const QString &sessionId, double score, EngineError *errorOut) {
    const std::optional<Session> session = store_.mutate(sessionId, [this, score](Session &s) {
        if (!s.finalScore) {
            s.finalScore = score;
            qCInfo(lcSession) << "Session" << s.id << "scored" << score;
        }
        expireIfDue(s);
    });
    if (!session) {
        setError(errorOut, EngineError::Kind::NotFound, "Session not found");
        return false;
    }
    return true;
}

std::optional<int> SessionLedger::advanceStage(const QString &sessionId, EngineError *errorOut) {
    const std::optional<Session> session = store_.mutate(sessionId, [](Session &s) {
        ++s.currentStageIndex;
    });
    if (!session) {
        setError(errorOut, EngineError::Kind::NotFound, "Session not found");
        return std::nullopt;
    }
    qCInfo(lcSession) << "Session" << sessionId << "advanced to stage" << session->currentStageIndex;
    return session->currentStageIndex;
}
