#pragma once
#include "semantic/ports.h"
#include "proxy/connection_pool.h"

// Forwarder over the shared ConnectionPool. Buffered calls are bounded by
// the request timeout, streaming calls by the (longer) stream timeout.
class QtExecutor : public IExecutor {
public:
    explicit QtExecutor(ConnectionPool& pool);

    Result<ProviderResponse> execute(const ProviderRequest& request) override;
    Result<ProviderStream> connectStream(const ProviderRequest& request) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    void setStreamTimeout(int ms) { m_streamTimeout = ms; }

    static DomainFailure classifyTransportError(QNetworkReply::NetworkError code,
                                                const QString& detail);

private:
    ConnectionPool& m_pool;
    int m_requestTimeout = 180000;
    int m_streamTimeout = 600000;

    QMap<QNetworkReply*, QNetworkAccessManager*> m_streamManagers;

    QNetworkRequest buildQtRequest(const ProviderRequest& request, int timeoutMs) const;
    QNetworkReply* send(QNetworkAccessManager* nam, const ProviderRequest& request,
                        const QNetworkRequest& req) const;
    static QMap<QString, QString> collectHeaders(QNetworkReply* reply);
};
