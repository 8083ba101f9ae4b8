#pragma once
#include "semantic/ports.h"
#include "semantic/request.h"
#include "semantic/response.h"
#include <QJsonValue>
#include <QStringList>

// Codec for the standard chat-completion protocol spoken by clients.
class OpenAIChatAdapter {
public:
    OpenAIChatAdapter() = default;

    Result<ChatRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) const;
    QByteArray encodeResponse(const StandardResponse& response) const;
    QByteArray encodeChunk(const StandardChunk& chunk) const;
    QByteArray encodeFailure(const DomainFailure& failure) const;

    static QString parseContentField(const QJsonValue& content);
    static QStringList parseStopField(const QJsonValue& stop);
    static QString generateChatId();
};
