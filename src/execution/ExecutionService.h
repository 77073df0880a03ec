#pragma once

#include "core/EngineError.h"
#include "execution/SandboxConfig.h"
#include "execution/StageAggregator.h"
#include "execution/TestTargetRunner.h"
#include "question/QuestionConfig.h"

#include <QMap>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

class QuestionRepository;
class WorkspaceMaterializer;

struct ExecutionOutcome {
    AggregateResult aggregate;
    qint64 runtimeMs = 0;
};

// One end-to-end execution: load the question, materialize a scoped
// sandbox, re-validate stages 0..stageIndex and discard the sandbox.
// Each call owns its workspace and runner; concurrent calls share only the
// repository's guarded cache.
class ExecutionService {
public:
    using RunnerFactory = std::function<std::unique_ptr<TestTargetRunner>(const QuestionConfig &)>;

    ExecutionService(const QuestionRepository &repository,
                     const WorkspaceMaterializer &materializer,
                     RunnerFactory runnerFactory);

    std::optional<ExecutionOutcome> runCode(const QString &questionName,
                                            const QMap<QString, QString> &candidateFiles,
                                            int stageIndex,
                                            EngineError *errorOut = nullptr) const;

    // Builds SandboxRunners parsing output in the question's test dialect.
    static RunnerFactory sandboxRunnerFactory(const SandboxConfig &config);

private:
    const QuestionRepository &repository_;
    const WorkspaceMaterializer &materializer_;
    RunnerFactory runnerFactory_;
};
