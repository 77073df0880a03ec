#include "server/AssessmentServer.h"
#include "core/Logging.h"

#include <QFutureWatcher>
#include <QJsonDocument>
#include <QPointer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

AssessmentServer::AssessmentServer(const ApiRouter &router, QObject *parent)
    : QObject(parent), router_(router), server_(new QTcpServer(this)) {
    connect(server_, &QTcpServer::newConnection,
            this, &AssessmentServer::onNewConnection);
}

AssessmentServer::~AssessmentServer() {
    stop();
}

bool AssessmentServer::start(quint16 port, const QHostAddress &address) {
    if (server_->isListening()) {
        return true;
    }
    if (!server_->listen(address, port)) {
        emit errorOccurred(QString("Cannot listen on port %1: %2").arg(port).arg(server_->errorString()));
        return false;
    }
    activePort_ = server_->serverPort();
    qCInfo(lcServer) << "Listening on" << address.toString() << activePort_;
    return true;
}

void AssessmentServer::stop() {
    if (server_->isListening()) {
        server_->close();
    }

    // Close all pending connections
    for (auto it = connections_.begin(); it != connections_.end(); ++it) {
        it.key()->deleteLater();
    }
    connections_.clear();
}

bool AssessmentServer::isListening() const {
    return server_->isListening();
}

quint16 AssessmentServer::port() const {
    return activePort_;
}

QByteArray AssessmentServer::statusText(int status) {
    switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 410: return "Gone";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    default:  return "Internal Server Error";
    }
}

QByteArray AssessmentServer::serializeResponse(const HttpResponse &response) {
    const QByteArray body = response.status == 204
        ? QByteArray()
        : QJsonDocument(response.body).toJson(QJsonDocument::Compact);
    QByteArray data = "HTTP/1.1 " + QByteArray::number(response.status) + ' ' + statusText(response.status) + "\r\n";
    if (!body.isEmpty()) {
        data += "Content-Type: application/json\r\n";
    }
    data += "Access-Control-Allow-Origin: *\r\n"
            "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
            "Access-Control-Allow-Headers: Content-Type\r\n";
    data += "Content-Length: " + QByteArray::number(body.size()) + "\r\n"
            "Connection: close\r\n"
            "\r\n";
    return data + body;
}

void AssessmentServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket *socket = server_->nextPendingConnection();

        connect(socket, &QTcpSocket::readyRead,
                this, &AssessmentServer::onReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &AssessmentServer::onDisconnected);

        // Misbehaving clients get kSocketTimeoutMs to deliver a full request
        QTimer *timeout = new QTimer(socket);
        timeout->setSingleShot(true);
        connect(timeout, &QTimer::timeout, this, [this, socket]() {
            connections_.remove(socket);
            socket->abort();
            socket->deleteLater();
        });
        timeout->start(kSocketTimeoutMs);

        connections_[socket] = Connection{QByteArray(), timeout};
    }
}

void AssessmentServer::rejectAndClose(QTcpSocket *socket, int status) {
    connections_.remove(socket);
    socket->write(serializeResponse(HttpResponse{status, QJsonObject{{"error", QString(statusText(status))}}}));
    socket->flush();
    socket->disconnectFromHost();
}

void AssessmentServer::onReadyRead() {
    QTcpSocket *socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !connections_.contains(socket)) {
        return;
    }

    Connection &connection = connections_[socket];
    connection.buffer.append(socket->readAll());

    // Guard against unbounded memory growth
    if (connection.buffer.size() > kMaxBufferSize) {
        qCWarning(lcServer) << "Request exceeds" << kMaxBufferSize << "bytes; closing";
        rejectAndClose(socket, 413);
        return;
    }

    const QByteArray &buffer = connection.buffer;
    const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd == -1) {
        return;  // Headers not complete yet
    }

    const QByteArray headers = buffer.left(headerEnd);
    const qsizetype requestLineEnd = headers.indexOf("\r\n");
    const QList<QByteArray> requestLine = headers.left(requestLineEnd == -1 ? headers.size() : requestLineEnd)
                                              .split(' ');
    if (requestLine.size() < 2) {
        rejectAndClose(socket, 400);
        return;
    }

    HttpRequest request;
    request.method = QString::fromLatin1(requestLine.at(0)).toUpper();
    request.path = QString::fromUtf8(requestLine.at(1)).section('?', 0, 0);

    // Parse Content-Length from headers
    qint64 contentLength = -1;
    const qsizetype clPos = headers.toLower().indexOf("\r\ncontent-length:");
    if (clPos != -1) {
        qsizetype lineEnd = headers.indexOf("\r\n", clPos + 2);
        if (lineEnd == -1) {
            lineEnd = headers.size();
        }
        const QByteArray clLine = headers.mid(clPos + 17, lineEnd - clPos - 17).trimmed();
        bool ok = false;
        contentLength = clLine.toLongLong(&ok);
        if (!ok || contentLength < 0) {
            contentLength = -1;
        }
    }

    if (request.method == "OPTIONS") {
        connections_.remove(socket);
        reply(socket, HttpResponse{204, QJsonObject()});
        return;
    }
    if (contentLength < 0) {
        if (request.method == "POST") {
            // Without Content-Length the body size is unknown
            rejectAndClose(socket, 411);
            return;
        }
        contentLength = 0;
    }

    const qsizetype bodyStart = headerEnd + 4;
    if (buffer.size() < bodyStart + contentLength) {
        return;  // Body not complete yet
    }
    request.body = buffer.mid(bodyStart, contentLength);

    // The request is complete; execution time is bounded by the sandbox timeouts.
    connection.timeout->stop();
    connections_.remove(socket);
    dispatch(socket, request);
}

void AssessmentServer::dispatch(QTcpSocket *socket, const HttpRequest &request) {
    QPointer<QTcpSocket> guarded(socket);
    auto *watcher = new QFutureWatcher<HttpResponse>(this);
    connect(watcher, &QFutureWatcher<HttpResponse>::finished, this, [this, watcher, guarded]() {
        const HttpResponse response = watcher->result();
        watcher->deleteLater();
        if (!guarded) {
            qCDebug(lcServer) << "Client went away before the response was ready";
            return;
        }
        reply(guarded, response);
    });
    const ApiRouter &router = router_;
    watcher->setFuture(QtConcurrent::run([&router, request]() {
        return router.handle(request);
    }));
}

void AssessmentServer::reply(QTcpSocket *socket, const HttpResponse &response) {
    if (response.status >= 500) {
        qCWarning(lcServer) << "Request failed with" << response.status << response.body.value("detail").toString();
    }
    socket->write(serializeResponse(response));
    socket->flush();
    socket->disconnectFromHost();
}

void AssessmentServer::onDisconnected() {
    QTcpSocket *socket = qobject_cast<QTcpSocket*>(sender());
    if (socket) {
        connections_.remove(socket);
        socket->deleteLater();
    }
}
