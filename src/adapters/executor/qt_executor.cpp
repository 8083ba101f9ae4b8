#include "qt_executor.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QTimer>
#include <QNetworkReply>
#include <QUrl>

QtExecutor::QtExecutor(ConnectionPool& pool)
    : m_pool(pool)
{
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request, int timeoutMs) const {
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setTransferTimeout(timeoutMs);
    return req;
}

QNetworkReply* QtExecutor::send(QNetworkAccessManager* nam, const ProviderRequest& request,
                                const QNetworkRequest& req) const {
    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return nam->post(req, request.body);
    if (method == "GET")
        return nam->get(req);
    return nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

QMap<QString, QString> QtExecutor::collectHeaders(QNetworkReply* reply) {
    QMap<QString, QString> headers;
    for (const auto& header : reply->rawHeaderList())
        headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
    return headers;
}

DomainFailure QtExecutor::classifyTransportError(QNetworkReply::NetworkError code,
                                                 const QString& detail) {
    switch (code) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        return DomainFailure::timeout(QStringLiteral("请求超时，请稍后重试"));
    default:
        return DomainFailure::unavailable(
            QStringLiteral("无法连接到阿里云百炼API: ") + detail);
    }
}

Result<ProviderResponse> QtExecutor::execute(const ProviderRequest& request) {
    auto* nam = m_pool.acquire();
    QNetworkRequest req = buildQtRequest(request, m_requestTimeout);
    QNetworkReply* reply = send(nam, request, req);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_requestTimeout);
    loop.exec();

    if (reply->isRunning()) {
        reply->abort();
        // The reply is a child of nam, which release() may delete
        reply->deleteLater();
        m_pool.release(nam);
        LOG_WARNING(QStringLiteral("Upstream request timed out after %1 ms").arg(m_requestTimeout));
        return std::unexpected(classifyTransportError(QNetworkReply::TimeoutError, {}));
    }

    // HTTP-level errors still carry a status and a body worth translating
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0) {
        const DomainFailure failure = classifyTransportError(reply->error(), reply->errorString());
        LOG_ERROR(QStringLiteral("Upstream request failed: %1").arg(reply->errorString()));
        reply->deleteLater();
        m_pool.release(nam);
        return std::unexpected(failure);
    }

    ProviderResponse resp;
    resp.statusCode = status;
    resp.body = reply->readAll();
    resp.headers = collectHeaders(reply);

    reply->deleteLater();
    m_pool.release(nam);
    return resp;
}

Result<ProviderStream> QtExecutor::connectStream(const ProviderRequest& request) {
    auto* nam = m_pool.acquire();
    QDeadlineTimer deadline(m_streamTimeout);
    QNetworkRequest req = buildQtRequest(request, m_streamTimeout);
    QNetworkReply* reply = send(nam, request, req);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::errorOccurred, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_streamTimeout);
    loop.exec();

    int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0) {
        const DomainFailure failure = reply->isRunning()
            ? classifyTransportError(QNetworkReply::TimeoutError, {})
            : classifyTransportError(reply->error(), reply->errorString());
        LOG_ERROR(QStringLiteral("Upstream stream failed to open: %1").arg(failure.message));
        reply->abort();
        reply->deleteLater();
        m_pool.release(nam);
        return std::unexpected(failure);
    }

    ProviderStream stream;
    stream.statusCode = status;
    stream.headers = collectHeaders(reply);
    stream.deadline = deadline;

    if (status < 200 || status >= 300) {
        // Drain the error body within what is left of the timeout
        if (reply->isRunning()) {
            QEventLoop drainLoop;
            QObject::connect(reply, &QNetworkReply::finished, &drainLoop, &QEventLoop::quit);
            QTimer drainTimer;
            drainTimer.setSingleShot(true);
            QObject::connect(&drainTimer, &QTimer::timeout, &drainLoop, &QEventLoop::quit);
            drainTimer.start(static_cast<int>(qMax<qint64>(0, deadline.remainingTime())));
            drainLoop.exec();
        }
        stream.errorBody = reply->readAll();
        reply->abort();
        reply->deleteLater();
        m_pool.release(nam);
        return stream;
    }

    m_streamManagers.insert(reply, nam);
    QObject::connect(reply, &QObject::destroyed, [this, reply]() {
        auto it = m_streamManagers.find(reply);
        if (it != m_streamManagers.end()) {
            m_pool.release(it.value());
            m_streamManagers.erase(it);
        }
    });

    stream.reply = reply;
    return stream;
}
