#pragma once

#include "core/Clock.h"
#include "core/EngineError.h"
#include "session/Session.h"
#include "session/SessionStore.h"

#include <QString>

#include <optional>

struct SessionLimits {
    int defaultMinutes = 60;
    int minMinutes = 1;
    int maxMinutes = 120;

    int clamp(std::optional<int> requestedMinutes) const;
};

// Lifecycle of assessment sessions: creation, time accounting with lazy
// expiry, stage advancement and the final score. All time comes from the
// injected Clock.
class SessionLedger {
public:
    SessionLedger(SessionStore &store, const Clock &clock, const SessionLimits &limits = {});

    const SessionLimits &limits() const { return limits_; }

    // An absent or zero duration means the default.
    Session create(const QString &questionName, std::optional<int> durationMinutes = std::nullopt);

    // Flips an active session to Expired once its time is up.
    std::optional<Session> get(const QString &sessionId, EngineError *errorOut = nullptr);

    int remainingSeconds(const Session &session) const;
    QDateTime expiresAt(const Session &session) const { return session.expiresAt(); }

    // Records the score once; later calls keep the first value.
    bool markScore(const QString &sessionId, double score, EngineError *errorOut = nullptr);

    // Exactly +1 per call. Callers only invoke it after a verified unlock.
    std::optional<int> advanceStage(const QString &sessionId, EngineError *errorOut = nullptr);

private:
    void expireIfDue(Session &session) const;

    SessionStore &store_;
    const Clock &clock_;
    SessionLimits limits_;
};
