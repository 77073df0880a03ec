#pragma once

#include "core/EngineError.h"
#include "execution/StageAggregator.h"
#include "service/AssessmentService.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QMap>
#include <QString>

#include <optional>

// Wire format of the HTTP API. Field names are snake_case.
namespace JsonCodec {

QJsonObject sessionToJson(const SessionView &view);
QJsonObject questionToJson(const QuestionView &view);
QJsonObject executeResultToJson(const ExecuteResult &result);
// Per-stage counts of a one-off run; hidden output is never included.
QJsonObject aggregateToJson(const AggregateResult &aggregate, qint64 runtimeMs);
QJsonValue hintToJson(const std::optional<HintTrigger> &hint);
QJsonObject errorToJson(const EngineError &error);

// Only string values are accepted; anything else fails with InvalidRequest.
std::optional<QMap<QString, QString>> filesFromJson(const QJsonValue &value, EngineError *errorOut = nullptr);

int httpStatusFor(const EngineError &error);

} // namespace JsonCodec
