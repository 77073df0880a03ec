#pragma once

#include "session/Session.h"

#include <QHash>
#include <QMutex>
#include <QString>

#include <functional>
#include <optional>

// Keyed session storage. mutate() applies the callback atomically with
// respect to other calls on the same store, which is what keeps a session's
// stage index and status consistent under concurrent requests.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<Session> get(const QString &sessionId) const = 0;
    virtual bool create(const Session &session) = 0;
    virtual std::optional<Session> mutate(const QString &sessionId,
                                          const std::function<void(Session &)> &mutation) = 0;
    virtual int size() const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    std::optional<Session> get(const QString &sessionId) const override {
        QMutexLocker locker(&mutex_);
        const auto it = sessions_.constFind(sessionId);
        if (it == sessions_.constEnd()) {
            return std::nullopt;
        }
        return it.value();
    }

    bool create(const Session &session) override {
        QMutexLocker locker(&mutex_);
        if (sessions_.contains(session.id)) {
            return false;
        }
        sessions_.insert(session.id, session);
        return true;
    }

    std::optional<Session> mutate(const QString &sessionId,
                                  const std::function<void(Session &)> &mutation) override {
        QMutexLocker locker(&mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        mutation(it.value());
        return it.value();
    }

    int size() const override {
        QMutexLocker locker(&mutex_);
        return static_cast<int>(sessions_.size());
    }

private:
    mutable QMutex mutex_;
    QHash<QString, Session> sessions_;
};
