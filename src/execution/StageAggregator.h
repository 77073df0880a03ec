#pragma once

#include "core/EngineError.h"
#include "execution/TestTargetRunner.h"
#include "question/QuestionConfig.h"

#include <QList>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

// Per-stage roll-up of every target the stage ran.
struct StageRunResult {
    QString name;
    int visiblePassed = 0;
    int visibleTotal = 0;
    int hiddenPassed = 0;
    int hiddenTotal = 0;
    QString output;       // joined non-empty visible outputs; hidden output never lands here
    bool passed = false;
    QStringList errors;   // wire names of hard failures, e.g. "timeout"
    int targetsRun = 0;   // targets that produced a RunResult
};

struct AggregateResult {
    int currentIndex = 0;
    int totalStages = 0;
    QList<StageRunResult> stages;
    bool currentPassed = false;
    bool unlockedNext = false;
    double score = 0.0;
    QString currentName;
    EngineError firstHardError;  // first runner failure, with hidden target names scrubbed

    // True when no target ran at all and at least one failed hard: the
    // runtime itself is unusable and the verdict carries no information.
    bool runtimeUnusable() const {
        for (const StageRunResult &stage : stages) {
            if (stage.targetsRun > 0) {
                return false;
            }
        }
        return firstHardError.isSet();
    }

    const StageRunResult *current() const {
        return stages.isEmpty() ? nullptr : &stages.last();
    }
};

// Re-runs every stage from 0 through the requested one on each call, so a
// regression in an earlier stage is caught before a later stage can unlock.
class StageAggregator {
public:
    // Called before each target; returns false (and fills errorOut) when the
    // sandbox could not be brought back to its materialized state.
    using SandboxReset = std::function<bool(const QString &sandboxRoot, EngineError *errorOut)>;

    explicit StageAggregator(const TestTargetRunner &runner, SandboxReset resetSandbox = {});

    AggregateResult runUpTo(const QString &sandboxRoot,
                            const QList<Stage> &stages,
                            int requestedIndex) const;

    StageRunResult runStage(const QString &sandboxRoot, const Stage &stage,
                            EngineError *firstError = nullptr) const;

    static int clampIndex(int requestedIndex, int stageCount);

private:
    std::optional<RunResult> runTarget(const QString &sandboxRoot, const QString &target,
                                       EngineError *errorOut) const;

    const TestTargetRunner &runner_;
    SandboxReset resetSandbox_;
};
