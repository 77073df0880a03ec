#include "server/JsonCodec.h"

#include <QJsonArray>

namespace {

QJsonValue optionalNumber(const std::optional<double> &value) {
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonObject filesToJson(const QMap<QString, QString> &files) {
    QJsonObject object;
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        object.insert(it.key(), it.value());
    }
    return object;
}

} // namespace

namespace JsonCodec {

QJsonObject sessionToJson(const SessionView &view) {
    QJsonObject object;
    object["session_id"] = view.session.id;
    object["question_name"] = view.session.questionName;
    object["remaining_seconds"] = view.remainingSeconds;
    object["expires_at"] = static_cast<double>(view.expiresAt.toMSecsSinceEpoch()) / 1000.0;
    object["status"] = sessionStatusName(view.session.status);
    object["final_score"] = optionalNumber(view.session.finalScore);
    object["current_stage_index"] = view.session.currentStageIndex;
    object["stages"] = QJsonArray::fromStringList(view.stages);
    return object;
}

QJsonObject questionToJson(const QuestionView &view) {
    const QuestionConfig &config = view.config;
    QJsonObject question;
    question["name"] = config.name;
    question["visible_files"] = QJsonArray::fromStringList(config.candidateEditableFiles);
    question["entrypoint"] = config.entrypoint;
    question["default_duration_minutes"] = config.defaultDurationMinutes;
    question["tags"] = QJsonArray::fromStringList(config.tags);
    question["estimated_difficulty"] = config.estimatedDifficulty;
    question["test_dialect"] = config.testDialect;

    QJsonObject object;
    object["question"] = question;
    object["files"] = filesToJson(view.files);
    object["stages"] = QJsonArray::fromStringList(config.stageNames());
    return object;
}

QJsonValue hintToJson(const std::optional<HintTrigger> &hint) {
    if (!hint) {
        return QJsonValue(QJsonValue::Null);
    }
    QJsonObject object;
    object["kind"] = signalKindName(hint->signal.kind);
    object["timestamp"] = hint->signal.timestamp;
    object["context"] = QJsonObject::fromVariantMap(hint->signal.context);
    object["message"] = hint->hint;
    return object;
}

QJsonObject executeResultToJson(const ExecuteResult &result) {
    QJsonObject visible;
    visible["passed"] = result.visiblePassed;
    visible["total"] = result.visibleTotal;
    visible["output"] = result.visibleOutput;

    QJsonObject hidden;
    hidden["passed"] = result.hiddenPassed;
    hidden["total"] = result.hiddenTotal;

    QJsonObject stage;
    stage["current_index"] = result.stage.currentIndex;
    stage["total_stages"] = result.stage.totalStages;
    stage["current_passed"] = result.stage.currentPassed;
    stage["unlocked_next"] = result.stage.unlockedNext;
    stage["name"] = result.stage.name;

    QJsonObject object;
    object["visible"] = visible;
    object["hidden"] = hidden;
    object["runtime_ms"] = static_cast<double>(result.runtimeMs);
    object["final_score"] = result.finalScore;
    object["stage"] = stage;
    object["unlocked_stage_index"] = result.unlockedStageIndex ? QJsonValue(*result.unlockedStageIndex)
                                                               : QJsonValue(QJsonValue::Null);
    object["unlocked_stage_name"] = result.unlockedStageName ? QJsonValue(*result.unlockedStageName)
                                                             : QJsonValue(QJsonValue::Null);
    object["new_visible_files"] = filesToJson(result.newVisibleFiles);
    object["hint"] = hintToJson(result.hint);
    object["summary"] = result.summary;
    return object;
}

QJsonObject aggregateToJson(const AggregateResult &aggregate, qint64 runtimeMs) {
    QJsonArray stages;
    for (const StageRunResult &stage : aggregate.stages) {
        QJsonObject object;
        object["name"] = stage.name;
        object["visible_passed"] = stage.visiblePassed;
        object["visible_total"] = stage.visibleTotal;
        object["hidden_passed"] = stage.hiddenPassed;
        object["hidden_total"] = stage.hiddenTotal;
        object["passed"] = stage.passed;
        object["errors"] = QJsonArray::fromStringList(stage.errors);
        stages.append(object);
    }

    QJsonObject object;
    object["current_index"] = aggregate.currentIndex;
    object["total_stages"] = aggregate.totalStages;
    object["current_passed"] = aggregate.currentPassed;
    object["unlocked_next"] = aggregate.unlockedNext;
    object["final_score"] = aggregate.score;
    object["name"] = aggregate.currentName;
    object["output"] = aggregate.current() ? aggregate.current()->output : QString();
    object["runtime_ms"] = static_cast<double>(runtimeMs);
    object["stages"] = stages;
    return object;
}

QJsonObject errorToJson(const EngineError &error) {
    QJsonObject object;
    object["error"] = error.kindName();
    object["detail"] = error.message;
    return object;
}

std::optional<QMap<QString, QString>> filesFromJson(const QJsonValue &value, EngineError *errorOut) {
    if (!value.isObject()) {
        setError(errorOut, EngineError::Kind::InvalidRequest, "files must be an object");
        return std::nullopt;
    }
    QMap<QString, QString> files;
    const QJsonObject object = value.toObject();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (!it.value().isString()) {
            setError(errorOut, EngineError::Kind::InvalidRequest,
                     QString("File %1 must be a string").arg(it.key()));
            return std::nullopt;
        }
        files.insert(it.key(), it.value().toString());
    }
    return files;
}

int httpStatusFor(const EngineError &error) {
    switch (error.kind) {
    case EngineError::Kind::None:
        return 200;
    case EngineError::Kind::NotFound:
        return 404;
    case EngineError::Kind::Expired:
        return 410;
    case EngineError::Kind::InvalidRequest:
        return 400;
    case EngineError::Kind::PolicyViolation:
    case EngineError::Kind::WorkspaceEscape:
        return 403;
    case EngineError::Kind::Timeout:
    case EngineError::Kind::EnvironmentUnavailable:
    case EngineError::Kind::Internal:
        return 500;
    }
    return 500;
}

} // namespace JsonCodec
