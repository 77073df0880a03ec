#pragma once

#include <QDateTime>
#include <QTimeZone>

// Time source injected into the session ledger and the collaboration layer
// so expiry and cooldowns can be driven deterministically in tests.
class Clock {
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;

    // Seconds since the epoch, with millisecond resolution.
    double nowSeconds() const {
        return static_cast<double>(now().toMSecsSinceEpoch()) / 1000.0;
    }
};

class SystemClock : public Clock {
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }
};

// Manually advanced clock for tests and replays.
class ManualClock : public Clock {
public:
    explicit ManualClock(const QDateTime &start = QDateTime::fromSecsSinceEpoch(1700000000, QTimeZone::utc()))
        : now_(start) {}

    QDateTime now() const override { return now_; }
    void set(const QDateTime &value) { now_ = value; }
    void advanceSeconds(qint64 seconds) { now_ = now_.addSecs(seconds); }
    void advanceMs(qint64 ms) { now_ = now_.addMSecs(ms); }

private:
    QDateTime now_;
};
