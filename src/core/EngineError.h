#pragma once

#include <QString>

// Error taxonomy shared by every engine. Operations return bool or
// std::optional and fill an EngineError through an out-pointer.
struct EngineError {
    enum class Kind {
        None,
        NotFound,
        Timeout,
        EnvironmentUnavailable,
        Internal,
        PolicyViolation,
        WorkspaceEscape,
        Expired,
        InvalidRequest
    };

    Kind kind = Kind::None;
    QString message;

    bool isSet() const { return kind != Kind::None; }
    bool isExecutionError() const {
        return kind == Kind::Timeout || kind == Kind::EnvironmentUnavailable ||
               kind == Kind::Internal;
    }

    static QString kindName(Kind kind) {
        switch (kind) {
        case Kind::None:                   return QStringLiteral("none");
        case Kind::NotFound:               return QStringLiteral("not_found");
        case Kind::Timeout:                return QStringLiteral("timeout");
        case Kind::EnvironmentUnavailable: return QStringLiteral("environment_unavailable");
        case Kind::Internal:               return QStringLiteral("internal");
        case Kind::PolicyViolation:        return QStringLiteral("policy_violation");
        case Kind::WorkspaceEscape:        return QStringLiteral("workspace_escape");
        case Kind::Expired:                return QStringLiteral("expired");
        case Kind::InvalidRequest:         return QStringLiteral("invalid_request");
        }
        return QStringLiteral("none");
    }

    QString kindName() const { return kindName(kind); }
};

// Fills *errorOut when the caller asked for it.
inline void setError(EngineError *errorOut, EngineError::Kind kind, const QString &message) {
    if (errorOut) {
        errorOut->kind = kind;
        errorOut->message = message;
    }
}
