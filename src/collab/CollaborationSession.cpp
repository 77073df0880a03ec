#include "collab/CollaborationSession.h"
#include "core/Logging.h"

CollaborationSession::CollaborationSession(const QString &questionName,
                                           const QString &workspaceRoot,
                                           const Clock &clock,
                                           const StruggleThresholds &thresholds,
                                           const HintCatalog &hints,
                                           std::shared_ptr<const ConceptLookup> conceptLookup)
    : questionName_(questionName),
      workspace_(workspaceRoot),
      clock_(clock),
      detector_(thresholds),
      hints_(hints),
      conceptLookup_(conceptLookup ? std::move(conceptLookup)
                                   : std::make_shared<StaticConceptLookup>()),
      journal_(questionName) {}

void CollaborationSession::recordTransition(const ModeTransition &transition) {
    journal_.logModeSwitch(modeName(transition.previous), modeName(transition.current),
                           transition.trigger, clock_.nowSeconds());
    qCInfo(lcCollab) << "Mode" << modeName(transition.previous) << "->" << modeName(transition.current)
                     << "trigger:" << transition.trigger;
}

std::optional<ModeTransition> CollaborationSession::setMode(Mode mode, const QString &trigger) {
    const std::optional<ModeTransition> transition = modeState_.setMode(mode, trigger);
    if (transition) {
        recordTransition(*transition);
    }
    return transition;
}

HintTrigger CollaborationSession::respondToSignal(const StruggleSignal &signal, int level) {
    journal_.logStruggle(signalKindName(signal.kind), signal.timestamp, signal.context);
    return HintTrigger{signal, hints_.hintFor(signal, level)};
}

QStringList CollaborationSession::handleVoiceInput(const QString &utterance, int currentLevel) {
    QStringList responses;
    const std::optional<ModeTransition> transition = modeState_.applyVoiceCommand(utterance);
    if (transition) {
        recordTransition(*transition);
        if (transition->current == Mode::BotDrives) {
            responses << QStringLiteral("Taking over now. I will edit code and run tests.");
        } else {
            responses << QStringLiteral("Your turn. I will watch quietly and help if you get stuck.");
        }
        return responses;
    }

    if (mode() == Mode::HumanDrives) {
        const std::optional<StruggleSignal> signal = detector_.onUserMessage(utterance, clock_.nowSeconds());
        if (signal) {
            responses << respondToSignal(*signal, currentLevel).hint;
        }
    }
    return responses;
}

std::optional<HintTrigger> CollaborationSession::observeCodeUpdate(const QString &code, int currentLevel) {
    if (mode() != Mode::HumanDrives) {
        return std::nullopt;
    }
    const std::optional<StruggleSignal> signal = detector_.onCodeUpdate(code, clock_.nowSeconds());
    if (!signal) {
        return std::nullopt;
    }
    return respondToSignal(*signal, currentLevel);
}

std::optional<HintTrigger> CollaborationSession::observeRunResult(int exitCode, const QString &output,
                                                                  int stageIndex, int visiblePassed,
                                                                  int visibleTotal) {
    runHistory_ << RunHistoryEntry{exitCode, output, stageIndex, visiblePassed, visibleTotal};
    journal_.logTestResult(stageIndex, visiblePassed, visibleTotal);

    if (mode() != Mode::HumanDrives) {
        return std::nullopt;
    }
    const std::optional<StruggleSignal> signal =
        detector_.onRunResult(exitCode, output, stageIndex, clock_.nowSeconds());
    if (!signal) {
        return std::nullopt;
    }
    return respondToSignal(*signal, stageIndex + 1);
}

std::optional<HintTrigger> CollaborationSession::periodicCheck(int currentLevel, bool testsStillFailing) {
    if (mode() != Mode::HumanDrives) {
        return std::nullopt;
    }
    const double now = clock_.nowSeconds();
    std::optional<StruggleSignal> signal = detector_.checkIdle(testsStillFailing, now);
    if (!signal) {
        signal = detector_.checkLevelWall(currentLevel, now);
    }
    if (!signal) {
        return std::nullopt;
    }
    return respondToSignal(*signal, currentLevel);
}

void CollaborationSession::onLevelStart(int level) {
    detector_.onLevelStart(level, clock_.nowSeconds());
}

std::optional<QString> CollaborationSession::readFile(const QString &path, EngineError *errorOut) const {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::ReadFile, errorOut)) {
        return std::nullopt;
    }
    return workspace_.readFile(path, errorOut);
}

std::optional<QString> CollaborationSession::readDescription(int level, EngineError *errorOut) const {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::ReadDescription, errorOut)) {
        return std::nullopt;
    }
    return workspace_.readDescription(level, errorOut);
}

std::optional<QString> CollaborationSession::lookupConcept(const QString &query, EngineError *errorOut) {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::LookupConcept, errorOut)) {
        return std::nullopt;
    }
    const QString summary = conceptLookup_->lookup(query);
    journal_.logLookup(query, summary);
    return summary;
}

bool CollaborationSession::applyPatch(const QString &path, const QString &oldText, const QString &newText,
                                      EngineError *errorOut) {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::ApplyPatch, errorOut)) {
        return false;
    }
    return workspace_.applyPatch(path, oldText, newText, errorOut);
}

bool CollaborationSession::executeTests(const TestSubmitter &submit, EngineError *errorOut) {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::ExecuteTests, errorOut)) {
        return false;
    }
    if (!submit) {
        setError(errorOut, EngineError::Kind::Internal, "No assessment backend configured.");
        return false;
    }
    return submit(workspace_.snapshot(), errorOut);
}

std::optional<QString> CollaborationSession::getCurrentCode(const QString &path, EngineError *errorOut) const {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::GetCurrentCode, errorOut)) {
        return std::nullopt;
    }
    return workspace_.readFile(path, errorOut);
}

std::optional<QList<RunHistoryEntry>> CollaborationSession::getRunHistory(EngineError *errorOut) const {
    if (!ToolPolicy::assertAllowed(mode(), ToolAction::GetRunHistory, errorOut)) {
        return std::nullopt;
    }
    return runHistory_;
}

bool CollaborationSession::saveJournal(const QString &outputPath, const QString &codePath,
                                       EngineError *errorOut) {
    // Read directly: saving the journal is not a gated tool.
    if (const std::optional<QString> code = workspace_.readFile(codePath)) {
        journal_.setFinalCode(*code);
    }
    return journal_.save(outputPath, errorOut);
}

QString CollaborationSession::summarizeTestResult(int currentIndex, bool currentPassed, bool unlockedNext,
                                                  int visiblePassed, int visibleTotal) {
    if (currentPassed) {
        if (unlockedNext) {
            return QString("Level %1 passed. Unlocking Level %2.").arg(currentIndex + 1).arg(currentIndex + 2);
        }
        return QStringLiteral("All levels complete.");
    }
    return QString("Level %1: %2/%3 visible tests passing.")
        .arg(currentIndex + 1).arg(visiblePassed).arg(visibleTotal);
}
