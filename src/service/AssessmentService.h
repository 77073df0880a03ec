#pragma once

#include "collab/CollaborationSession.h"
#include "collab/StruggleDetector.h"
#include "core/Clock.h"
#include "core/EngineError.h"
#include "question/QuestionConfig.h"
#include "session/Session.h"

#include <QDateTime>
#include <QHash>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

#include <memory>
#include <optional>

class ExecutionService;
class QuestionRepository;
class SessionLedger;

struct SessionView {
    Session session;
    int remainingSeconds = 0;
    QDateTime expiresAt;
    QStringList stages;
};

struct QuestionView {
    QuestionConfig config;
    QMap<QString, QString> files;
};

struct StageInfo {
    int currentIndex = 0;
    int totalStages = 0;
    bool currentPassed = false;
    bool unlockedNext = false;
    QString name;
};

struct ExecuteResult {
    int visiblePassed = 0;
    int visibleTotal = 0;
    QString visibleOutput;
    int hiddenPassed = 0;
    int hiddenTotal = 0;
    double finalScore = 0.0;
    qint64 runtimeMs = 0;
    StageInfo stage;
    std::optional<int> unlockedStageIndex;
    std::optional<QString> unlockedStageName;
    QMap<QString, QString> newVisibleFiles;
    std::optional<HintTrigger> hint;
    QString summary;
};

struct CoachReply {
    Mode mode = Mode::BotDrives;
    QStringList messages;
    std::optional<HintTrigger> hint;
    int runHistorySize = 0;
};

struct CoachSettings {
    StruggleThresholds thresholds;
    QString journalDir;  // empty disables journal saving
};

// Front door of the assessment backend: sessions, executions and the
// per-session collaboration partner. Every call touching one session is
// serialized on that session's mutex; different sessions run in parallel.
class AssessmentService {
public:
    AssessmentService(const QuestionRepository &repository,
                      const ExecutionService &executionService,
                      SessionLedger &ledger,
                      const Clock &clock,
                      const CoachSettings &coachSettings = {},
                      const QString &scratchRoot = QString());
    ~AssessmentService();

    QStringList questionNames() const;
    std::optional<QuestionView> describeQuestion(const QString &questionName,
                                                 EngineError *errorOut = nullptr) const;

    // An absent or zero duration falls back to the question's default.
    std::optional<SessionView> start(const QString &questionName,
                                     std::optional<int> durationMinutes = std::nullopt,
                                     EngineError *errorOut = nullptr);
    std::optional<SessionView> get(const QString &sessionId, EngineError *errorOut = nullptr);

    std::optional<ExecuteResult> execute(const QString &sessionId,
                                         const QString &questionName,
                                         const QMap<QString, QString> &files,
                                         EngineError *errorOut = nullptr);

    // Collaboration feed
    std::optional<CoachReply> coachState(const QString &sessionId, EngineError *errorOut = nullptr) const;
    std::optional<CoachReply> setMode(const QString &sessionId, const QString &modeName,
                                      EngineError *errorOut = nullptr);
    std::optional<CoachReply> voiceInput(const QString &sessionId, const QString &utterance,
                                         int currentLevel, EngineError *errorOut = nullptr);
    std::optional<CoachReply> codeUpdate(const QString &sessionId, const QString &code,
                                         int currentLevel, EngineError *errorOut = nullptr);
    std::optional<CoachReply> periodicCheck(const QString &sessionId, int currentLevel,
                                            bool testsStillFailing, EngineError *errorOut = nullptr);
    std::optional<QString> lookupConcept(const QString &sessionId, const QString &query,
                                         EngineError *errorOut = nullptr);

    // The bot submits its working copy; only allowed while the bot drives.
    std::optional<ExecuteResult> botExecute(const QString &sessionId, EngineError *errorOut = nullptr);

    // Writes <journalDir>/<sessionId>.json and returns its path.
    std::optional<QString> saveJournal(const QString &sessionId, EngineError *errorOut = nullptr);

private:
    struct CollabSlot {
        QMutex mutex;
        QString questionName;
        QString codePath;  // editable file recorded as the journal's final code
        std::unique_ptr<QTemporaryDir> workingCopy;
        std::unique_ptr<CollaborationSession> collab;
    };

    std::shared_ptr<CollabSlot> slot(const QString &sessionId, EngineError *errorOut) const;
    std::shared_ptr<CollabSlot> createSlot(const QuestionConfig &config, EngineError *errorOut) const;
    SessionView makeView(const Session &session) const;
    std::optional<ExecuteResult> executeLocked(CollabSlot &slot, const QString &sessionId,
                                               const QString &questionName,
                                               const QMap<QString, QString> &files,
                                               EngineError *errorOut);
    void syncWorkingCopy(CollabSlot &slot, const QuestionConfig &config,
                         const QMap<QString, QString> &files) const;

    const QuestionRepository &repository_;
    const ExecutionService &executionService_;
    SessionLedger &ledger_;
    const Clock &clock_;
    CoachSettings coachSettings_;
    QString scratchRoot_;

    mutable QMutex slotsMutex_;
    QHash<QString, std::shared_ptr<CollabSlot>> slots_;
};
