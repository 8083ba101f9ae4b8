#include "adapters/inbound/openai_chat.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>

QString OpenAIChatAdapter::generateChatId()
{
    return QStringLiteral("chatcmpl-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString OpenAIChatAdapter::parseContentField(const QJsonValue& content)
{
    if (content.isString())
        return content.toString();

    // Multi-part content: only text parts reach the backend
    QString text;
    if (content.isArray()) {
        const QJsonArray parts = content.toArray();
        for (const QJsonValue& pv : parts) {
            const QJsonObject p = pv.toObject();
            if (p[QStringLiteral("type")].toString() == QStringLiteral("text"))
                text += p[QStringLiteral("text")].toString();
        }
    }
    return text;
}

QStringList OpenAIChatAdapter::parseStopField(const QJsonValue& stop)
{
    QStringList list;
    if (stop.isString()) {
        list.append(stop.toString());
    } else if (stop.isArray()) {
        for (const QJsonValue& sv : stop.toArray())
            list.append(sv.toString());
    }
    return list;
}

Result<ChatRequest> OpenAIChatAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata) const
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("请求格式错误: %1").arg(
                parseErr.error != QJsonParseError::NoError
                    ? parseErr.errorString()
                    : QStringLiteral("body is not a JSON object"))));
    }

    const QJsonObject root = doc.object();
    ChatRequest req;
    req.model = root[QStringLiteral("model")].toString();
    req.user = root[QStringLiteral("user")].toString();
    req.stream = root[QStringLiteral("stream")].toBool();

    const QJsonArray msgs = root[QStringLiteral("messages")].toArray();
    for (const QJsonValue& mv : msgs) {
        const QJsonObject m = mv.toObject();
        ChatMessage msg;
        msg.role = m[QStringLiteral("role")].toString();
        msg.content = parseContentField(m[QStringLiteral("content")]);
        msg.name = m[QStringLiteral("name")].toString();
        req.messages.append(msg);
    }

    // Only fields present with a usable value are recorded
    SamplingParameters& p = req.sampling;
    if (root[QStringLiteral("temperature")].isDouble())
        p.temperature = root[QStringLiteral("temperature")].toDouble();
    if (root[QStringLiteral("top_p")].isDouble())
        p.topP = root[QStringLiteral("top_p")].toDouble();
    if (root[QStringLiteral("max_tokens")].isDouble())
        p.maxTokens = root[QStringLiteral("max_tokens")].toInt();
    if (root[QStringLiteral("presence_penalty")].isDouble())
        p.presencePenalty = root[QStringLiteral("presence_penalty")].toDouble();
    if (root[QStringLiteral("frequency_penalty")].isDouble())
        p.frequencyPenalty = root[QStringLiteral("frequency_penalty")].toDouble();
    p.stop = parseStopField(root[QStringLiteral("stop")]);

    req.metadata = metadata;
    return req;
}

QByteArray OpenAIChatAdapter::encodeResponse(const StandardResponse& response) const
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.id;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion");
    root[QStringLiteral("created")] = response.created;
    root[QStringLiteral("model")] = response.model;

    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("content")] = response.content;

    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("message")] = message;
    choice[QStringLiteral("finish_reason")] = response.finishReason;
    root[QStringLiteral("choices")] = QJsonArray{choice};

    QJsonObject usage;
    usage[QStringLiteral("prompt_tokens")] = response.usage.promptTokens;
    usage[QStringLiteral("completion_tokens")] = response.usage.completionTokens;
    usage[QStringLiteral("total_tokens")] = response.usage.totalTokens;
    root[QStringLiteral("usage")] = usage;

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray OpenAIChatAdapter::encodeChunk(const StandardChunk& chunk) const
{
    QJsonObject root;
    root[QStringLiteral("id")] = chunk.id;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
    root[QStringLiteral("created")] = chunk.created;
    root[QStringLiteral("model")] = chunk.model;

    QJsonObject delta;
    if (chunk.deltaContent)
        delta[QStringLiteral("content")] = *chunk.deltaContent;

    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("delta")] = delta;
    choice[QStringLiteral("finish_reason")] = chunk.finishReason
        ? QJsonValue(*chunk.finishReason) : QJsonValue(QJsonValue::Null);
    root[QStringLiteral("choices")] = QJsonArray{choice};

    if (chunk.usage) {
        QJsonObject usage;
        usage[QStringLiteral("prompt_tokens")] = chunk.usage->promptTokens;
        usage[QStringLiteral("completion_tokens")] = chunk.usage->completionTokens;
        usage[QStringLiteral("total_tokens")] = chunk.usage->totalTokens;
        root[QStringLiteral("usage")] = usage;
    }

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray OpenAIChatAdapter::encodeFailure(const DomainFailure& failure) const
{
    return failure.toBody();
}
