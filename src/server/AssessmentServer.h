#pragma once

#include "server/ApiRouter.h"

#include <QHostAddress>
#include <QMap>
#include <QObject>

class QTcpServer;
class QTcpSocket;
class QTimer;

// Minimal HTTP/1.1 listener for the assessment API. One request per
// connection; the handler runs on the global QThreadPool so a long test
// execution never blocks the event loop.
class AssessmentServer : public QObject {
    Q_OBJECT

public:
    static constexpr quint16 kDefaultPort = 10043;

    // Safety limits
    static constexpr qint64 kMaxBufferSize = 4 * 1024 * 1024;  // 4 MB
    static constexpr int kSocketTimeoutMs = 10000;              // until the request is complete

    explicit AssessmentServer(const ApiRouter &router, QObject *parent = nullptr);
    ~AssessmentServer();

    bool start(quint16 port = kDefaultPort, const QHostAddress &address = QHostAddress::LocalHost);
    void stop();
    bool isListening() const;
    quint16 port() const;

    static QByteArray statusText(int status);
    static QByteArray serializeResponse(const HttpResponse &response);

signals:
    void errorOccurred(const QString &error);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    struct Connection {
        QByteArray buffer;
        QTimer *timeout = nullptr;
    };

    void dispatch(QTcpSocket *socket, const HttpRequest &request);
    void reply(QTcpSocket *socket, const HttpResponse &response);
    void rejectAndClose(QTcpSocket *socket, int status);

    const ApiRouter &router_;
    QTcpServer *server_ = nullptr;
    quint16 activePort_ = 0;
    QMap<QTcpSocket*, Connection> connections_;
};
