#include "service/AssessmentService.h"
#include "execution/ExecutionService.h"
#include "question/QuestionRepository.h"
#include "session/SessionLedger.h"
#include "core/Logging.h"

#include <QDir>

#include <algorithm>

AssessmentService::AssessmentService(const QuestionRepository &repository,
                                     const ExecutionService &executionService,
                                     SessionLedger &ledger,
                                     const Clock &clock,
                                     const CoachSettings &coachSettings,
                                     const QString &scratchRoot)
    : repository_(repository),
      executionService_(executionService),
      ledger_(ledger),
      clock_(clock),
      coachSettings_(coachSettings),
      scratchRoot_(scratchRoot) {}

AssessmentService::~AssessmentService() = default;

QStringList AssessmentService::questionNames() const {
    return repository_.questionNames();
}

std::optional<QuestionView> AssessmentService::describeQuestion(const QString &questionName,
                                                                EngineError *errorOut) const {
    const std::optional<QuestionConfig> config = repository_.load(questionName, errorOut);
    if (!config) {
        return std::nullopt;
    }
    return QuestionView{*config, repository_.visibleFiles(*config)};
}

std::shared_ptr<AssessmentService::CollabSlot> AssessmentService::createSlot(const QuestionConfig &config,
                                                                             EngineError *errorOut) const {
    auto slot = std::make_shared<CollabSlot>();
    slot->questionName = config.name;
    slot->codePath = config.candidateEditableFiles.value(0, config.entrypoint);

    const QString base = scratchRoot_.isEmpty() ? QDir::tempPath() : scratchRoot_;
    slot->workingCopy = std::make_unique<QTemporaryDir>(QDir(base).filePath("pairbench-work-XXXXXX"));
    if (!slot->workingCopy->isValid()) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Failed to create working copy: %1").arg(slot->workingCopy->errorString()));
        return nullptr;
    }

    slot->collab = std::make_unique<CollaborationSession>(config.name, slot->workingCopy->path(), clock_,
                                                          coachSettings_.thresholds, HintCatalog(config.hints));
    const QMap<QString, QString> files = repository_.visibleFiles(config);
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        if (!slot->collab->workspace().writeFile(it.key(), it.value(), errorOut)) {
            return nullptr;
        }
    }
    qCDebug(lcSession) << "Working copy for" << config.name << "at" << slot->workingCopy->path();
    return slot;
}

std::shared_ptr<AssessmentService::CollabSlot> AssessmentService::slot(const QString &sessionId,
                                                                       EngineError *errorOut) const {
    QMutexLocker locker(&slotsMutex_);
    const std::shared_ptr<CollabSlot> found = slots_.value(sessionId);
    if (!found) {
        setError(errorOut, EngineError::Kind::NotFound, "Session not found");
    }
    return found;
}

SessionView AssessmentService::makeView(const Session &session) const {
    SessionView view;
    view.session = session;
    view.remainingSeconds = ledger_.remainingSeconds(session);
    view.expiresAt = ledger_.expiresAt(session);
    if (const std::optional<QuestionConfig> config = repository_.load(session.questionName)) {
        view.stages = config->stageNames();
    }
    return view;
}

std::optional<SessionView> AssessmentService::start(const QString &questionName,
                                                    std::optional<int> durationMinutes,
                                                    EngineError *errorOut) {
    const std::optional<QuestionConfig> config = repository_.load(questionName, errorOut);
    if (!config) {
        return std::nullopt;
    }

    const std::optional<int> duration = durationMinutes.value_or(0) != 0
        ? durationMinutes
        : std::optional<int>(config->defaultDurationMinutes);
    const std::shared_ptr<CollabSlot> newSlot = createSlot(*config, errorOut);
    if (!newSlot) {
        return std::nullopt;
    }
    const Session session = ledger_.create(questionName, duration);
    // Level numbers are 1-based in everything the candidate sees.
    newSlot->collab->onLevelStart(1);
    {
        QMutexLocker locker(&slotsMutex_);
        slots_.insert(session.id, newSlot);
    }

    qCInfo(lcSession) << "start" << session.id << questionName
                      << "duration_minutes" << session.durationMinutes;
    return makeView(session);
}

std::optional<SessionView> AssessmentService::get(const QString &sessionId, EngineError *errorOut) {
    const std::optional<Session> session = ledger_.get(sessionId, errorOut);
    if (!session) {
        return std::nullopt;
    }
    return makeView(*session);
}

void AssessmentService::syncWorkingCopy(CollabSlot &slot, const QuestionConfig &config,
                                        const QMap<QString, QString> &files) const {
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        if (!config.isCandidateEditable(it.key())) {
            continue;
        }
        EngineError error;
        if (!slot.collab->workspace().writeFile(it.key(), it.value(), &error)) {
            qCWarning(lcSession) << "Could not update working copy:" << error.message;
        }
    }
}

std::optional<ExecuteResult> AssessmentService::executeLocked(CollabSlot &slot,
                                                              const QString &sessionId,
                                                              const QString &questionName,
                                                              const QMap<QString, QString> &files,
                                                              EngineError *errorOut) {
    const std::optional<Session> session = ledger_.get(sessionId, errorOut);
    if (!session) {
        return std::nullopt;
    }
    if (session->questionName != questionName) {
        setError(errorOut, EngineError::Kind::InvalidRequest, "Question mismatch for session");
        return std::nullopt;
    }
    if (ledger_.remainingSeconds(*session) <= 0) {
        setError(errorOut, EngineError::Kind::Expired, "Session expired");
        return std::nullopt;
    }

    const std::optional<ExecutionOutcome> outcome =
        executionService_.runCode(questionName, files, session->currentStageIndex, errorOut);
    if (!outcome) {
        return std::nullopt;
    }
    const AggregateResult &aggregate = outcome->aggregate;
    const StageRunResult *current = aggregate.current();
    if (!current) {
        setError(errorOut, EngineError::Kind::Internal,
                 QString("Question %1 has no stages").arg(questionName));
        return std::nullopt;
    }

    ExecuteResult result;
    result.visiblePassed = current->visiblePassed;
    result.visibleTotal = current->visibleTotal;
    result.visibleOutput = current->output;
    result.hiddenPassed = current->hiddenPassed;
    result.hiddenTotal = current->hiddenTotal;
    result.finalScore = aggregate.score;
    result.runtimeMs = outcome->runtimeMs;
    result.stage = StageInfo{aggregate.currentIndex, aggregate.totalStages, aggregate.currentPassed,
                             aggregate.unlockedNext, aggregate.currentName};

    // The score is recorded once, so only a run where every stage holds counts.
    const bool isFinalStage = aggregate.currentIndex == aggregate.totalStages - 1;
    const bool allStagesPassed = std::all_of(aggregate.stages.cbegin(), aggregate.stages.cend(),
                                             [](const StageRunResult &stage) { return stage.passed; });
    if (isFinalStage && allStagesPassed) {
        ledger_.markScore(sessionId, aggregate.score);
    }

    const std::optional<QuestionConfig> config = repository_.load(questionName, errorOut);
    if (!config) {
        return std::nullopt;
    }
    if (aggregate.unlockedNext) {
        const std::optional<int> next = ledger_.advanceStage(sessionId, errorOut);
        if (!next) {
            return std::nullopt;
        }
        result.unlockedStageIndex = *next;
        if (*next < config->stageCount()) {
            result.unlockedStageName = config->stages.at(*next).name;
            result.newVisibleFiles = repository_.revealedFiles(*config, *next);
        }
    }

    syncWorkingCopy(slot, *config, files);
    for (auto it = result.newVisibleFiles.constBegin(); it != result.newVisibleFiles.constEnd(); ++it) {
        EngineError error;
        if (!slot.collab->workspace().writeFile(it.key(), it.value(), &error)) {
            qCWarning(lcSession) << "Could not reveal" << it.key() << ":" << error.message;
        }
    }

    const int stageIndex = aggregate.currentIndex;
    result.hint = slot.collab->observeRunResult(aggregate.currentPassed ? 0 : 1, current->output, stageIndex,
                                                current->visiblePassed, current->visibleTotal);
    if (aggregate.unlockedNext) {
        slot.collab->onLevelStart(stageIndex + 2);
    }
    result.summary = CollaborationSession::summarizeTestResult(stageIndex, aggregate.currentPassed,
                                                               aggregate.unlockedNext,
                                                               current->visiblePassed, current->visibleTotal);

    qCInfo(lcSession) << "run" << sessionId << "stage" << stageIndex
                      << "visible" << QString("%1/%2").arg(result.visiblePassed).arg(result.visibleTotal)
                      << "unlocked_next" << aggregate.unlockedNext << "runtime_ms" << result.runtimeMs;
    return result;
}

std::optional<ExecuteResult> AssessmentService::execute(const QString &sessionId,
                                                        const QString &questionName,
                                                        const QMap<QString, QString> &files,
                                                        EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    return executeLocked(*target, sessionId, questionName, files, errorOut);
}

std::optional<ExecuteResult> AssessmentService::botExecute(const QString &sessionId, EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    std::optional<ExecuteResult> result;
    const bool submitted = target->collab->executeTests(
        [&](const QMap<QString, QString> &files, EngineError *submitError) {
            result = executeLocked(*target, sessionId, target->questionName, files, submitError);
            return result.has_value();
        },
        errorOut);
    if (!submitted) {
        return std::nullopt;
    }
    return result;
}

std::optional<CoachReply> AssessmentService::coachState(const QString &sessionId, EngineError *errorOut) const {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    CoachReply reply;
    reply.mode = target->collab->mode();
    reply.runHistorySize = target->collab->runHistorySize();
    return reply;
}

std::optional<CoachReply> AssessmentService::setMode(const QString &sessionId, const QString &modeName,
                                                     EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    const std::optional<Mode> mode = modeFromName(modeName);
    if (!mode) {
        setError(errorOut, EngineError::Kind::InvalidRequest, "Invalid mode");
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    target->collab->setMode(*mode, QStringLiteral("ui_toggle"));
    CoachReply reply;
    reply.mode = target->collab->mode();
    return reply;
}

std::optional<CoachReply> AssessmentService::voiceInput(const QString &sessionId, const QString &utterance,
                                                        int currentLevel, EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    CoachReply reply;
    reply.messages = target->collab->handleVoiceInput(utterance, currentLevel);
    reply.mode = target->collab->mode();
    return reply;
}

std::optional<CoachReply> AssessmentService::codeUpdate(const QString &sessionId, const QString &code,
                                                        int currentLevel, EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    CoachReply reply;
    reply.hint = target->collab->observeCodeUpdate(code, currentLevel);
    reply.mode = target->collab->mode();
    return reply;
}

std::optional<CoachReply> AssessmentService::periodicCheck(const QString &sessionId, int currentLevel,
                                                           bool testsStillFailing, EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    CoachReply reply;
    reply.hint = target->collab->periodicCheck(currentLevel, testsStillFailing);
    reply.mode = target->collab->mode();
    return reply;
}

std::optional<QString> AssessmentService::lookupConcept(const QString &sessionId, const QString &query,
                                                        EngineError *errorOut) {
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    return target->collab->lookupConcept(query, errorOut);
}

std::optional<QString> AssessmentService::saveJournal(const QString &sessionId, EngineError *errorOut) {
    if (coachSettings_.journalDir.isEmpty()) {
        setError(errorOut, EngineError::Kind::InvalidRequest, "Journal directory is not configured");
        return std::nullopt;
    }
    const std::shared_ptr<CollabSlot> target = slot(sessionId, errorOut);
    if (!target) {
        return std::nullopt;
    }
    QMutexLocker locker(&target->mutex);
    const QString path = QDir(coachSettings_.journalDir).filePath(sessionId + ".json");
    if (!target->collab->saveJournal(path, target->codePath, errorOut)) {
        return std::nullopt;
    }
    return path;
}
