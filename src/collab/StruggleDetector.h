#pragma once

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QString>
#include <QVariantMap>

#include <limits>
#include <optional>

enum class SignalKind {
    LongPause,
    RepeatedFailure,
    Backtrack,
    LevelWall,
    ExplicitAsk
};

QString signalKindName(SignalKind kind);

struct StruggleSignal {
    SignalKind kind = SignalKind::LongPause;
    double timestamp = 0.0;
    QVariantMap context;
};

struct StruggleThresholds {
    double idleSeconds = 30.0;
    double levelWallSeconds = 300.0;
    double backtrackRatio = 0.2;
    double cooldownSeconds = 60.0;
};

// Watches a human-driven session for signs of being stuck. Every signal
// kind shares one cooldown: nothing is emitted until cooldownSeconds have
// passed since the previous emission. Times are seconds, passed in by the
// caller.
class StruggleDetector {
public:
    explicit StruggleDetector(const StruggleThresholds &thresholds = {});

    const StruggleThresholds &thresholds() const { return thresholds_; }

    // Backtrack: the new code is shorter than (1 - ratio) of the previous snapshot.
    std::optional<StruggleSignal> onCodeUpdate(const QString &code, double now);

    // Repeated failure: same nonzero exit code and same output as the previous run.
    std::optional<StruggleSignal> onRunResult(int exitCode, const QString &output,
                                              int stageIndex, double now);

    void onLevelStart(int level, double now);

    std::optional<StruggleSignal> onUserMessage(const QString &message, double now);

    std::optional<StruggleSignal> checkIdle(bool testsStillFailing, double now);
    std::optional<StruggleSignal> checkLevelWall(int level, double now);

    std::optional<double> lastEditTime() const { return lastEditTime_; }
    int runCount() const { return static_cast<int>(runs_.size()); }

private:
    struct RunRecord {
        int exitCode;
        QByteArray digest;
        int stageIndex;
    };

    std::optional<StruggleSignal> emitSignal(SignalKind kind, double now, const QVariantMap &context);

    StruggleThresholds thresholds_;
    std::optional<double> lastEditTime_;
    QList<RunRecord> runs_;
    QList<int> codeLengths_;
    QHash<int, double> levelStartTimes_;
    double lastSignalTime_ = -std::numeric_limits<double>::infinity();
};
