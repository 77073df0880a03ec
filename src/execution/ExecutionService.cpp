#include "execution/ExecutionService.h"
#include "execution/SandboxRunner.h"
#include "execution/SummaryParser.h"
#include "question/QuestionRepository.h"
#include "workspace/WorkspaceMaterializer.h"
#include "core/Logging.h"

#include <QElapsedTimer>

ExecutionService::ExecutionService(const QuestionRepository &repository,
                                   const WorkspaceMaterializer &materializer,
                                   RunnerFactory runnerFactory)
    : repository_(repository),
      materializer_(materializer),
      runnerFactory_(std::move(runnerFactory)) {}

ExecutionService::RunnerFactory ExecutionService::sandboxRunnerFactory(const SandboxConfig &config) {
    return [config](const QuestionConfig &question) -> std::unique_ptr<TestTargetRunner> {
        std::shared_ptr<const OutputSummaryParser> parser = makeSummaryParser(question.testDialect);
        if (!parser) {
            return nullptr;
        }
        return std::make_unique<SandboxRunner>(config, parser, question.environment);
    };
}

std::optional<ExecutionOutcome> ExecutionService::runCode(const QString &questionName,
                                                          const QMap<QString, QString> &candidateFiles,
                                                          int stageIndex,
                                                          EngineError *errorOut) const {
    QElapsedTimer timer;
    timer.start();

    const std::optional<QuestionConfig> config = repository_.load(questionName, errorOut);
    if (!config) {
        return std::nullopt;
    }

    const std::unique_ptr<TestTargetRunner> runner = runnerFactory_ ? runnerFactory_(*config) : nullptr;
    if (!runner) {
        setError(errorOut, EngineError::Kind::InvalidRequest,
                 QString("Unsupported test dialect: %1").arg(config->testDialect));
        return std::nullopt;
    }

    const std::unique_ptr<QTemporaryDir> sandbox = materializer_.materialize(*config, candidateFiles, errorOut);
    if (!sandbox) {
        return std::nullopt;
    }

    // Every target starts from the materialized image, whatever the one
    // before it wrote into the sandbox.
    const StageAggregator aggregator(*runner, [&](const QString &root, EngineError *resetError) {
        return materializer_.restore(*config, candidateFiles, root, resetError);
    });
    ExecutionOutcome outcome;
    outcome.aggregate = aggregator.runUpTo(sandbox->path(), config->stages, stageIndex);
    outcome.runtimeMs = timer.elapsed();

    if (outcome.aggregate.runtimeUnusable()) {
        const EngineError &error = outcome.aggregate.firstHardError;
        setError(errorOut, error.kind, error.message);
        qCWarning(lcExecution) << "No test target of" << questionName << "could run:" << error.message;
        return std::nullopt;
    }

    qCInfo(lcExecution) << "Executed" << questionName << "through stage" << outcome.aggregate.currentIndex
                        << "score" << outcome.aggregate.score << "in" << outcome.runtimeMs << "ms";
    return outcome;
}
