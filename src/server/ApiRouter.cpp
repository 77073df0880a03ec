#include "server/ApiRouter.h"
#include "server/JsonCodec.h"
#include "service/AssessmentService.h"
#include "core/Logging.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace {

HttpResponse errorResponse(const EngineError &error) {
    return HttpResponse{JsonCodec::httpStatusFor(error), JsonCodec::errorToJson(error)};
}

HttpResponse badRequest(const QString &message) {
    EngineError error;
    setError(&error, EngineError::Kind::InvalidRequest, message);
    return errorResponse(error);
}

HttpResponse notFound(const QString &message) {
    EngineError error;
    setError(&error, EngineError::Kind::NotFound, message);
    return errorResponse(error);
}

// Missing or null current_level means level 1.
int levelFrom(const QJsonObject &body) {
    const int level = body.value("current_level").toInt(0);
    return level > 0 ? level : 1;
}

QJsonObject coachReplyJson(const CoachReply &reply) {
    QJsonObject object;
    object["mode"] = modeName(reply.mode);
    return object;
}

} // namespace

ApiRouter::ApiRouter(AssessmentService &service)
    : service_(service) {}

HttpResponse ApiRouter::handle(const HttpRequest &request) const {
    const QString method = request.method.toUpper();
    qCDebug(lcServer) << method << request.path;
    if (method == "GET") {
        return handleGet(request.path);
    }
    if (method != "POST") {
        return HttpResponse{405, JsonCodec::errorToJson(EngineError{EngineError::Kind::InvalidRequest,
                                                                    "Method not allowed"})};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(request.body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return badRequest(QString("JSON parse error: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return badRequest("Expected JSON object");
    }
    return handlePost(request.path, doc.object());
}

HttpResponse ApiRouter::handleGet(const QString &path) const {
    EngineError error;
    if (path == "/api/questions") {
        return HttpResponse{200, QJsonObject{{"questions", QJsonArray::fromStringList(service_.questionNames())}}};
    }
    if (path.startsWith("/api/questions/")) {
        const auto view = service_.describeQuestion(path.mid(15), &error);
        return view ? HttpResponse{200, JsonCodec::questionToJson(*view)} : errorResponse(error);
    }
    if (path.startsWith("/api/assessment/")) {
        const auto view = service_.get(path.mid(16), &error);
        return view ? HttpResponse{200, JsonCodec::sessionToJson(*view)} : errorResponse(error);
    }
    if (path.startsWith("/api/voice/")) {
        const QString sessionId = path.mid(11);
        const auto reply = service_.coachState(sessionId, &error);
        if (!reply) {
            return errorResponse(error);
        }
        QJsonObject body = coachReplyJson(*reply);
        body["session_id"] = sessionId;
        body["run_history_size"] = reply->runHistorySize;
        return HttpResponse{200, body};
    }
    return notFound(QString("No route for GET %1").arg(path));
}

HttpResponse ApiRouter::handlePost(const QString &path, const QJsonObject &body) const {
    EngineError error;
    if (path == "/api/assessment/start") {
        const QString questionName = body.value("question_name").toString();
        if (questionName.isEmpty()) {
            return badRequest("question_name is required");
        }
        std::optional<int> duration;
        if (body.value("duration_minutes").isDouble()) {
            duration = body.value("duration_minutes").toInt();
        }
        const auto view = service_.start(questionName, duration, &error);
        return view ? HttpResponse{200, JsonCodec::sessionToJson(*view)} : errorResponse(error);
    }
    if (path == "/api/execute") {
        const auto files = JsonCodec::filesFromJson(body.value("files"), &error);
        if (!files) {
            return errorResponse(error);
        }
        const auto result = service_.execute(body.value("session_id").toString(),
                                             body.value("question_name").toString(), *files, &error);
        return result ? HttpResponse{200, JsonCodec::executeResultToJson(*result)} : errorResponse(error);
    }
    if (path.startsWith("/api/voice/")) {
        return handleVoice(path.mid(11), body);
    }
    return notFound(QString("No route for POST %1").arg(path));
}

HttpResponse ApiRouter::handleVoice(const QString &action, const QJsonObject &body) const {
    EngineError error;
    const QString sessionId = body.value("session_id").toString();

    if (action == "mode") {
        const auto reply = service_.setMode(sessionId, body.value("mode").toString(), &error);
        if (!reply) {
            return errorResponse(error);
        }
        QJsonObject object = coachReplyJson(*reply);
        object["session_id"] = sessionId;
        return HttpResponse{200, object};
    }
    if (action == "input") {
        const auto reply = service_.voiceInput(sessionId, body.value("utterance").toString(),
                                               levelFrom(body), &error);
        if (!reply) {
            return errorResponse(error);
        }
        QJsonObject object = coachReplyJson(*reply);
        object["messages"] = QJsonArray::fromStringList(reply->messages);
        return HttpResponse{200, object};
    }
    if (action == "code_update" || action == "check") {
        std::optional<CoachReply> reply;
        if (action == "code_update") {
            reply = service_.codeUpdate(sessionId, body.value("code").toString(), levelFrom(body), &error);
        } else {
            reply = service_.periodicCheck(sessionId, levelFrom(body),
                                           body.value("tests_still_failing").toBool(true), &error);
        }
        if (!reply) {
            return errorResponse(error);
        }
        QJsonObject object = coachReplyJson(*reply);
        object["message"] = reply->hint ? QJsonValue(reply->hint->hint) : QJsonValue(QJsonValue::Null);
        object["hint"] = JsonCodec::hintToJson(reply->hint);
        return HttpResponse{200, object};
    }
    if (action == "lookup") {
        const auto summary = service_.lookupConcept(sessionId, body.value("query").toString(), &error);
        if (!summary) {
            return errorResponse(error);
        }
        const auto state = service_.coachState(sessionId, &error);
        QJsonObject object{{"summary", *summary}};
        if (state) {
            object["mode"] = modeName(state->mode);
        }
        return HttpResponse{200, object};
    }
    if (action == "bot_execute") {
        const auto result = service_.botExecute(sessionId, &error);
        return result ? HttpResponse{200, JsonCodec::executeResultToJson(*result)} : errorResponse(error);
    }
    if (action == "journal") {
        const auto path = service_.saveJournal(sessionId, &error);
        return path ? HttpResponse{200, QJsonObject{{"path", *path}}} : errorResponse(error);
    }
    return notFound(QString("No route for POST /api/voice/%1").arg(action));
}
