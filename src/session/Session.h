#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

enum class SessionStatus {
    Active,
    Expired
};

inline QString sessionStatusName(SessionStatus status) {
    return status == SessionStatus::Expired ? QStringLiteral("expired") : QStringLiteral("active");
}

// One timed assessment attempt. currentStageIndex only grows, status flips
// to Expired at most once, and finalScore is written when the last stage
// passes.
struct Session {
    QString id;
    QString questionName;
    QDateTime startedAt;
    int durationMinutes = 60;
    SessionStatus status = SessionStatus::Active;
    int currentStageIndex = 0;
    std::optional<double> finalScore;

    QDateTime expiresAt() const { return startedAt.addSecs(static_cast<qint64>(durationMinutes) * 60); }
};
