#pragma once

#include "collab/ConceptLookup.h"
#include "collab/HintCatalog.h"
#include "collab/ModeStateMachine.h"
#include "collab/SessionJournal.h"
#include "collab/StruggleDetector.h"
#include "collab/ToolPolicy.h"
#include "core/Clock.h"
#include "core/EngineError.h"
#include "workspace/QuestionWorkspace.h"

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>

struct HintTrigger {
    StruggleSignal signal;
    QString hint;
};

struct RunHistoryEntry {
    int exitCode = 0;
    QString output;
    int stageIndex = 0;
    int visiblePassed = 0;
    int visibleTotal = 0;
};

// The pairing partner for one assessment session. Owns the driving mode,
// the struggle detector and the journal, and exposes the file and test
// tools, each gated by ToolPolicy for the current mode. Struggle signals
// are only acted on while the human drives.
class CollaborationSession {
public:
    using TestSubmitter = std::function<bool(const QMap<QString, QString> &files, EngineError *errorOut)>;

    CollaborationSession(const QString &questionName,
                         const QString &workspaceRoot,
                         const Clock &clock,
                         const StruggleThresholds &thresholds = {},
                         const HintCatalog &hints = HintCatalog(),
                         std::shared_ptr<const ConceptLookup> conceptLookup = nullptr);

    QString questionName() const { return questionName_; }
    Mode mode() const { return modeState_.mode(); }

    std::optional<ModeTransition> setMode(Mode mode, const QString &trigger = QStringLiteral("manual"));

    // A mode command yields one acknowledgment; otherwise, in human mode, a
    // request for help yields one hint.
    QStringList handleVoiceInput(const QString &utterance, int currentLevel);

    std::optional<HintTrigger> observeCodeUpdate(const QString &code, int currentLevel);
    std::optional<HintTrigger> observeRunResult(int exitCode, const QString &output, int stageIndex,
                                                int visiblePassed = 0, int visibleTotal = 0);
    // Idle is checked first; the level wall only when idle stays quiet.
    std::optional<HintTrigger> periodicCheck(int currentLevel, bool testsStillFailing);
    void onLevelStart(int level);

    // Gated tools
    std::optional<QString> readFile(const QString &path, EngineError *errorOut = nullptr) const;
    std::optional<QString> readDescription(int level, EngineError *errorOut = nullptr) const;
    std::optional<QString> lookupConcept(const QString &query, EngineError *errorOut = nullptr);
    bool applyPatch(const QString &path, const QString &oldText, const QString &newText,
                    EngineError *errorOut = nullptr);
    bool executeTests(const TestSubmitter &submit, EngineError *errorOut = nullptr);
    std::optional<QString> getCurrentCode(const QString &path, EngineError *errorOut = nullptr) const;
    std::optional<QList<RunHistoryEntry>> getRunHistory(EngineError *errorOut = nullptr) const;

    int runHistorySize() const { return static_cast<int>(runHistory_.size()); }
    const SessionJournal &journal() const { return journal_; }
    QuestionWorkspace &workspace() { return workspace_; }
    const QuestionWorkspace &workspace() const { return workspace_; }

    // Records codePath as the final code, then writes the journal.
    bool saveJournal(const QString &outputPath, const QString &codePath, EngineError *errorOut = nullptr);

    static QString summarizeTestResult(int currentIndex, bool currentPassed, bool unlockedNext,
                                       int visiblePassed, int visibleTotal);

private:
    HintTrigger respondToSignal(const StruggleSignal &signal, int level);
    void recordTransition(const ModeTransition &transition);

    QString questionName_;
    QuestionWorkspace workspace_;
    const Clock &clock_;
    ModeStateMachine modeState_;
    StruggleDetector detector_;
    HintCatalog hints_;
    std::shared_ptr<const ConceptLookup> conceptLookup_;
    QList<RunHistoryEntry> runHistory_;
    SessionJournal journal_;
};
