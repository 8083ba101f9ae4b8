#include "failure.h"
#include <QJsonDocument>

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:     return 400;
    case ErrorKind::NotFound:         return 404;
    case ErrorKind::MethodNotAllowed: return 405;
    case ErrorKind::Timeout:          return 504;
    case ErrorKind::Upstream:         return status > 0 ? status : 502;
    case ErrorKind::Unavailable:
    case ErrorKind::Internal:
    default:                          return 500;
    }
}

QString DomainFailure::typeForStatus(int httpStatus) {
    switch (httpStatus) {
    case 400: return QStringLiteral("invalid_request_error");
    case 401: return QStringLiteral("authentication_error");
    case 403: return QStringLiteral("permission_error");
    case 404: return QStringLiteral("invalid_request_error");
    case 429: return QStringLiteral("rate_limit_error");
    case 500:
    case 502:
    case 503: return QStringLiteral("server_error");
    default:  return QStringLiteral("api_error");
    }
}

QString DomainFailure::errorType() const {
    if (!type.isEmpty())
        return type;

    switch (kind) {
    case ErrorKind::InvalidInput:
    case ErrorKind::NotFound:
    case ErrorKind::MethodNotAllowed: return QStringLiteral("invalid_request_error");
    case ErrorKind::Timeout:          return QStringLiteral("timeout_error");
    case ErrorKind::Upstream:         return typeForStatus(status);
    case ErrorKind::Unavailable:
    case ErrorKind::Internal:
    default:                          return QStringLiteral("server_error");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["message"] = message;
    err["type"] = errorType();
    if (!code.isEmpty())
        err["code"] = code;
    QJsonObject root;
    root["error"] = err;
    return root;
}

QByteArray DomainFailure::toBody() const {
    if (!rawBody.isEmpty())
        return rawBody;
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, {}, code, msg, 0, {}};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::NotFound, {}, QStringLiteral("not_found"), msg, 0, {}};
}

DomainFailure DomainFailure::methodNotAllowed(const QString& msg) {
    return {ErrorKind::MethodNotAllowed, {}, QStringLiteral("method_not_allowed"), msg, 0, {}};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, {}, {}, msg, 0, {}};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, {}, {}, msg, 0, {}};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, {}, {}, msg, 0, {}};
}

DomainFailure DomainFailure::upstream(int httpStatus, const QString& code, const QString& msg) {
    return {ErrorKind::Upstream, {}, code, msg, httpStatus, {}};
}

DomainFailure DomainFailure::passthrough(int httpStatus, const QByteArray& body) {
    return {ErrorKind::Upstream, {}, {}, {}, httpStatus, body};
}
