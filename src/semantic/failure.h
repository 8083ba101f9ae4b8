#pragma once
#include "types.h"
#include <QByteArray>
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     type;        // wire "type"; derived from kind/status when empty
    QString     code;
    QString     message;
    int         status = 0;  // upstream HTTP status for ErrorKind::Upstream
    QByteArray  rawBody;     // forwarded verbatim instead of the envelope when set

    int httpStatus() const;
    QString errorType() const;
    QJsonObject toJson() const;
    QByteArray toBody() const;

    static QString typeForStatus(int httpStatus);

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure methodNotAllowed(const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg);
    static DomainFailure upstream(int httpStatus, const QString& code, const QString& msg);
    static DomainFailure passthrough(int httpStatus, const QByteArray& body);
};
