#pragma once
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QDeadlineTimer>
#include <QMap>
#include <QNetworkReply>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
};

// An open streaming exchange. reply is null when the backend answered with
// a non-2xx status; errorBody then holds the drained response body.
struct ProviderStream {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QNetworkReply* reply = nullptr;
    QByteArray errorBody;
    QDeadlineTimer deadline{QDeadlineTimer::Forever};
};

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Result<ProviderResponse> execute(
        const ProviderRequest& request) = 0;
    virtual Result<ProviderStream> connectStream(
        const ProviderRequest& request) = 0;
};
