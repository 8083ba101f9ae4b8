#pragma once
#include "connection_pool.h"
#include "request_router.h"
#include "config/config_types.h"
#include "semantic/failure.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>
#include <QSet>

class Pipeline;
class PipelineStreamSession;

class ProxyServer : public QObject {
    Q_OBJECT
public:
    explicit ProxyServer(QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start(const GatewayConfig& config);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    void setPipeline(Pipeline* pipeline);
    ConnectionPool& connectionPool() { return m_connectionPool; }
    int activeStreamCount() const { return m_activeSessions.size(); }

    static PoolLimits poolLimitsFor(const TransportOptions& transport);
    static QString statusText(int status);
    // Backend headers the gateway sets itself or that no longer describe the body
    static bool isHopHeader(const QString& name);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool complete = false;
        int contentLength = 0;
    };

    HttpRequest parseHttpRequest(const QByteArray& data);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleChatCompletions(QTcpSocket* socket, const HttpRequest& request);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"),
                          const QMap<QString, QString>& extraHeaders = {});
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure);
    void sendStreamFailure(QTcpSocket* socket, const DomainFailure& failure);
    void sendStreamResponse(QTcpSocket* socket, PipelineStreamSession* session);
    void releaseSession(QTcpSocket* socket, PipelineStreamSession* session);
    QMap<QString, QString> buildMetadata(QTcpSocket* socket,
                                         const HttpRequest& request) const;

    QTcpServer* m_server = nullptr;
    ConnectionPool m_connectionPool;
    RequestRouter m_router;
    Pipeline* m_pipeline = nullptr;
    GatewayConfig m_config;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QSet<QTcpSocket*> m_continueSent;
    QMap<QTcpSocket*, PipelineStreamSession*> m_activeSessions;
};
