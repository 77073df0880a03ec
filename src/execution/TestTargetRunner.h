#pragma once

#include "core/EngineError.h"

#include <QString>

#include <optional>

// Outcome of running one test target.
struct RunResult {
    int exitCode = -1;
    QString rawOutput;  // stdout followed by stderr
    int passedCount = 0;
    int totalCount = 0;
    qint64 executionTimeMs = 0;
};

// Runs a single test target inside an already materialized workspace.
// A hard failure (timeout, missing runtime, launch error, path escape)
// returns std::nullopt and fills errorOut; a target that ran and failed
// its tests is a normal RunResult with a nonzero exit code.
class TestTargetRunner {
public:
    virtual ~TestTargetRunner() = default;
    virtual std::optional<RunResult> run(const QString &sandboxRoot,
                                         const QString &testTarget,
                                         EngineError *errorOut = nullptr) const = 0;
};
