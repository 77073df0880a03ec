#include "execution/StageAggregator.h"
#include "core/Logging.h"

#include <algorithm>

StageAggregator::StageAggregator(const TestTargetRunner &runner, SandboxReset resetSandbox)
    : runner_(runner), resetSandbox_(std::move(resetSandbox)) {}

std::optional<RunResult> StageAggregator::runTarget(const QString &sandboxRoot, const QString &target,
                                                    EngineError *errorOut) const {
    if (resetSandbox_ && !resetSandbox_(sandboxRoot, errorOut)) {
        return std::nullopt;
    }
    return runner_.run(sandboxRoot, target, errorOut);
}

int StageAggregator::clampIndex(int requestedIndex, int stageCount) {
    if (stageCount <= 0) {
        return 0;
    }
    return std::clamp(requestedIndex, 0, stageCount - 1);
}

StageRunResult StageAggregator::runStage(const QString &sandboxRoot, const Stage &stage,
                                         EngineError *firstError) const {
    StageRunResult result;
    result.name = stage.name;
    bool allExitedZero = true;
    QStringList visibleOutputs;

    for (const QString &target : stage.visibleTests) {
        EngineError error;
        const std::optional<RunResult> run = runTarget(sandboxRoot, target, &error);
        if (!run) {
            allExitedZero = false;
            result.errors << error.kindName();
            visibleOutputs << QString("%1: %2").arg(target, error.message);
            if (firstError && !firstError->isSet()) {
                *firstError = error;
            }
            qCInfo(lcExecution) << "Visible target" << target << "failed hard:" << error.kindName();
            continue;
        }
        ++result.targetsRun;
        result.visiblePassed += run->passedCount;
        result.visibleTotal += run->totalCount;
        visibleOutputs << run->rawOutput;
        if (run->exitCode != 0) {
            allExitedZero = false;
        }
    }

    for (const QString &target : stage.hiddenTests) {
        EngineError error;
        const std::optional<RunResult> run = runTarget(sandboxRoot, target, &error);
        if (!run) {
            // Neither the hidden target's name nor its message reaches the caller.
            allExitedZero = false;
            result.errors << error.kindName();
            if (firstError && !firstError->isSet()) {
                setError(firstError, error.kind, QString("A hidden test target failed: %1").arg(error.kindName()));
            }
            qCInfo(lcExecution) << "Hidden target failed hard:" << error.kindName();
            continue;
        }
        ++result.targetsRun;
        result.hiddenPassed += run->passedCount;
        result.hiddenTotal += run->totalCount;
        if (run->exitCode != 0) {
            allExitedZero = false;
        }
    }

    visibleOutputs.removeAll(QString());
    result.output = visibleOutputs.join('\n');
    result.passed = result.visiblePassed == result.visibleTotal &&
                    result.hiddenPassed == result.hiddenTotal &&
                    allExitedZero;
    return result;
}

AggregateResult StageAggregator::runUpTo(const QString &sandboxRoot,
                                         const QList<Stage> &stages,
                                         int requestedIndex) const {
    AggregateResult aggregate;
    aggregate.totalStages = static_cast<int>(stages.size());
    if (stages.isEmpty()) {
        return aggregate;
    }

    aggregate.currentIndex = clampIndex(requestedIndex, aggregate.totalStages);
    int stagesPassed = 0;
    bool allPassed = true;
    for (int i = 0; i <= aggregate.currentIndex; ++i) {
        StageRunResult stageResult = runStage(sandboxRoot, stages.at(i), &aggregate.firstHardError);
        if (stageResult.passed) {
            ++stagesPassed;
        } else {
            allPassed = false;
        }
        aggregate.stages << stageResult;
    }

    aggregate.currentPassed = aggregate.stages.last().passed;
    aggregate.unlockedNext = allPassed && aggregate.currentIndex + 1 < aggregate.totalStages;
    aggregate.score = stagesPassed * 100.0 / aggregate.totalStages;
    aggregate.currentName = stages.at(aggregate.currentIndex).name;

    qCDebug(lcExecution) << "Stages 0 through" << aggregate.currentIndex << "ran:"
                         << stagesPassed << "passed, score" << aggregate.score;
    return aggregate;
}
