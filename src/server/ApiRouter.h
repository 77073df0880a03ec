#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

class AssessmentService;

struct HttpRequest {
    QString method;
    QString path;
    QByteArray body;
};

struct HttpResponse {
    int status = 200;
    QJsonObject body;
};

// Maps the JSON API onto AssessmentService. Independent of sockets, so it
// can run on a worker thread and be driven directly in tests.
//
//   GET  /api/questions                 GET  /api/assessment/<id>
//   GET  /api/questions/<name>          POST /api/assessment/start
//   POST /api/execute                   GET  /api/voice/<id>
//   POST /api/voice/{mode,input,code_update,check,lookup,bot_execute,journal}
class ApiRouter {
public:
    explicit ApiRouter(AssessmentService &service);

    HttpResponse handle(const HttpRequest &request) const;

private:
    HttpResponse handleGet(const QString &path) const;
    HttpResponse handlePost(const QString &path, const QJsonObject &body) const;
    HttpResponse handleVoice(const QString &action, const QJsonObject &body) const;

    AssessmentService &service_;
};
