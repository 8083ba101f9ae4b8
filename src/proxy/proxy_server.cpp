#include "proxy_server.h"
#include "sse_writer.h"
#include "core/log_manager.h"
#include "pipeline/pipeline.h"

#include <QJsonDocument>
#include <QJsonObject>

ProxyServer::ProxyServer(QObject* parent)
    : QObject(parent)
{
    m_router.registerDefaults();
}

ProxyServer::~ProxyServer()
{
    stop();
}

// ========================================================================
// setPipeline
// ========================================================================

void ProxyServer::setPipeline(Pipeline* pipeline)
{
    m_pipeline = pipeline;
}

// ========================================================================
// poolLimitsFor
// ========================================================================

PoolLimits ProxyServer::poolLimitsFor(const TransportOptions& transport)
{
    // Every manager talks to the same backend host, so the per-host
    // limits are the effective ones.
    PoolLimits limits;
    limits.maxIdle = qMax(0, qMin(transport.maxIdleConns, transport.maxIdleConnsPerHost));
    limits.maxActive = qMax(1, transport.maxConnsPerHost);
    limits.idleTimeoutMs = qMax(0, transport.idleConnTimeout) * 1000;
    return limits;
}

// ========================================================================
// start
// ========================================================================

bool ProxyServer::start(const GatewayConfig& config)
{
    if (m_server) {
        stop();
    }

    m_config = config;
    m_connectionPool.clear();
    m_connectionPool.setLimits(poolLimitsFor(config.transport));

    const quint16 port = static_cast<quint16>(config.runtime.port);

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(QHostAddress::Any, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on port %1 - %2")
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on port %1").arg(m_server->serverPort()));
    return true;
}

// ========================================================================
// stop
// ========================================================================

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    // Sessions go before the pool: their replies hand managers back to it
    for (auto it = m_activeSessions.begin(); it != m_activeSessions.end(); ++it) {
        PipelineStreamSession* session = it.value();
        if (session) {
            session->abort();
            delete session;
        }
    }
    m_activeSessions.clear();

    for (auto it = m_pendingData.begin(); it != m_pendingData.end(); ++it) {
        QTcpSocket* socket = it.key();
        socket->disconnect(this);
        socket->disconnectFromHost();
        socket->deleteLater();
    }
    m_pendingData.clear();
    m_continueSent.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    m_connectionPool.clear();

    LOG_INFO(QStringLiteral("ProxyServer: gateway stopped"));
}

// ========================================================================
// isRunning
// ========================================================================

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// onNewConnection
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

// ========================================================================
// onSocketReadyRead
// ========================================================================

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData[socket] += socket->readAll();
    QByteArray& buffer = m_pendingData[socket];

    while (true) {
        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        int contentLength = 0;
        bool validLength = true;
        bool hasChunkedTransfer = false;
        bool expectsContinue = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                contentLength = line.mid(15).trimmed().toInt(&validLength);
                validLength = validLength && contentLength >= 0;
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
                hasChunkedTransfer = true;
            }
            if (line.startsWith(QStringLiteral("Expect:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("100-continue"), Qt::CaseInsensitive)) {
                expectsContinue = true;
            }
        }

        if (hasChunkedTransfer) {
            sendFailure(socket, DomainFailure::invalidInput(
                QStringLiteral("unsupported_transfer_encoding"),
                QStringLiteral("chunked request bodies are not supported")));
            buffer.clear();
            return;
        }

        if (!validLength) {
            sendFailure(socket, DomainFailure::invalidInput(
                QStringLiteral("invalid_content_length"),
                QStringLiteral("invalid Content-Length header")));
            buffer.clear();
            return;
        }

        const int bodyStart = headerEnd + 4;
        const qsizetype totalRequired = bodyStart + qsizetype(contentLength);
        if (buffer.size() < totalRequired) {
            if (expectsContinue && !m_continueSent.contains(socket)) {
                m_continueSent.insert(socket);
                socket->write("HTTP/1.1 100 Continue\r\n\r\n");
                socket->flush();
            }
            return;
        }

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);
        m_continueSent.remove(socket);

        const HttpRequest req = parseHttpRequest(requestData);
        handleRequest(socket, req);

        if (socket->state() != QAbstractSocket::ConnectedState) {
            return;
        }

        if (buffer.isEmpty()) {
            return;
        }
    }
}

// ========================================================================
// onSocketDisconnected
// ========================================================================

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    m_continueSent.remove(socket);

    PipelineStreamSession* session = m_activeSessions.take(socket);
    if (session) {
        LOG_INFO(QStringLiteral("ProxyServer: client went away mid-stream, aborting backend read"));
        session->abort();
        session->deleteLater();
    }

    socket->deleteLater();
    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

// ========================================================================
// parseHttpRequest
// ========================================================================

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Parse the request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    // Parse headers
    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    // Extract body
    req.body = data.mid(headerEnd + 4);
    req.contentLength = req.body.size();
    req.complete = true;

    return req;
}

// ========================================================================
// handleRequest
// ========================================================================

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    // ---- Route lookup ----
    auto routeOpt = m_router.match(request.method, request.path);
    if (!routeOpt) {
        if (m_router.knowsPath(request.path)) {
            sendFailure(socket, DomainFailure::methodNotAllowed(
                QStringLiteral("只支持POST请求")));
        } else {
            sendFailure(socket, DomainFailure::notFound(
                QStringLiteral("route not found: %1").arg(request.path)));
        }
        return;
    }

    const Route& route = *routeOpt;
    if (route.handler == QStringLiteral("health")) {
        QJsonObject health;
        health[QStringLiteral("status")] = QStringLiteral("ok");
        health[QStringLiteral("service")] = QStringLiteral("aliyun-bailian-proxy");
        sendHttpResponse(socket, 200, QJsonDocument(health).toJson(QJsonDocument::Compact));
        return;
    }

    handleChatCompletions(socket, request);
}

void ProxyServer::handleChatCompletions(QTcpSocket* socket, const HttpRequest& request)
{
    if (!m_pipeline) {
        sendFailure(socket, DomainFailure::internal(QStringLiteral("pipeline not configured")));
        return;
    }

    QMap<QString, QString> metadata = buildMetadata(socket, request);

    // ---- Detect streaming request ----
    QJsonParseError parseErr;
    QJsonDocument bodyDoc = QJsonDocument::fromJson(request.body, &parseErr);
    bool isStream = false;
    if (parseErr.error == QJsonParseError::NoError && bodyDoc.isObject()) {
        isStream = bodyDoc.object().value(QStringLiteral("stream")).toBool(false);
    }

    // ---- Dispatch to pipeline ----
    if (isStream) {
        auto result = m_pipeline->processStream(request.body, metadata);
        if (!result) {
            // Client errors are answered before any stream is opened
            if (result.error().kind == ErrorKind::InvalidInput)
                sendFailure(socket, result.error());
            else
                sendStreamFailure(socket, result.error());
            return;
        }
        sendStreamResponse(socket, *result);
    } else {
        auto result = m_pipeline->process(request.body, metadata);
        if (!result) {
            sendFailure(socket, result.error());
            return;
        }
        sendHttpResponse(socket, result->statusCode, result->body,
                         QStringLiteral("application/json"), result->headers);
    }
}

// ========================================================================
// sendHttpResponse
// ========================================================================

QString ProxyServer::statusText(int status)
{
    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {405, QStringLiteral("Method Not Allowed")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    return statusTexts.value(status, QStringLiteral("Unknown"));
}

bool ProxyServer::isHopHeader(const QString& name)
{
    static const QStringList skipped = {
        QStringLiteral("content-type"),
        QStringLiteral("content-length"),
        QStringLiteral("content-encoding"),
        QStringLiteral("transfer-encoding"),
        QStringLiteral("connection"),
        QStringLiteral("keep-alive"),
        QStringLiteral("access-control-allow-origin")
    };
    return skipped.contains(name.trimmed().toLower());
}

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType,
                                   const QMap<QString, QString>& extraHeaders)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText(status))
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    for (auto it = extraHeaders.constBegin(); it != extraHeaders.constEnd(); ++it) {
        if (isHopHeader(it.key()))
            continue;
        response.append(QStringLiteral("%1: %2\r\n").arg(it.key(), it.value()).toUtf8());
    }
    response.append("Access-Control-Allow-Origin: *\r\n");
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
}

void ProxyServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    sendHttpResponse(socket, failure.httpStatus(), failure.toBody());
}

// ========================================================================
// sendStreamResponse
// ========================================================================

void ProxyServer::sendStreamFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    // A relayed backend body keeps the backend status; translated failures
    // travel inside a 200 event stream
    const int status = failure.rawBody.isEmpty() ? 200 : failure.httpStatus();
    SseWriter::writeStreamHeader(socket, status, statusText(status).toUtf8());
    SseWriter::sendEvent(socket, failure.toBody());
    SseWriter::sendTerminator(socket);
}

void ProxyServer::releaseSession(QTcpSocket* socket, PipelineStreamSession* session)
{
    if (m_activeSessions.value(socket) == session) {
        m_activeSessions.remove(socket);
    }
    session->deleteLater();
}

void ProxyServer::sendStreamResponse(QTcpSocket* socket,
                                     PipelineStreamSession* session)
{
    m_activeSessions[socket] = session;

    // Write the HTTP response header with chunked transfer encoding
    SseWriter::writeStreamHeader(socket);

    // Forward each encoded frame immediately
    connect(session, &PipelineStreamSession::encodedFrameReady,
            socket, [socket](const QByteArray& data) {
                SseWriter::sendChunk(socket, data);
            });

    // The [DONE] sentinel follows only a translated stream that reached
    // its terminal frame; relayed streams carry their own
    connect(session, &PipelineStreamSession::finished,
            socket, [this, socket, session](StreamEnd end) {
                if (end == StreamEnd::Completed && !session->isPassthrough()) {
                    SseWriter::sendDone(socket);
                } else if (end == StreamEnd::Truncated) {
                    LOG_WARNING(QStringLiteral("ProxyServer: stream ended abnormally, closing without [DONE]"));
                }
                SseWriter::sendTerminator(socket);
                releaseSession(socket, session);
            });

    // On error, send the failure as a final SSE event, then terminate
    connect(session, &PipelineStreamSession::error,
            socket, [this, socket, session](const DomainFailure& failure) {
                SseWriter::sendEvent(socket, failure.toBody());
                SseWriter::sendTerminator(socket);
                releaseSession(socket, session);
            });

    session->start();
}

// ========================================================================
// buildMetadata
// ========================================================================

QMap<QString, QString> ProxyServer::buildMetadata(
    QTcpSocket* socket,
    const HttpRequest& request) const
{
    QMap<QString, QString> meta;
    meta[QStringLiteral("request_path")] = request.path;
    meta[QStringLiteral("peer")] = socket->peerAddress().toString();

    // The client's Accept is honoured for buffered calls
    const QString accept = request.headers.value(QStringLiteral("accept"));
    if (!accept.isEmpty()) {
        meta[QStringLiteral("accept")] = accept;
    }

    return meta;
}
