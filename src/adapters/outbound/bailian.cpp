#include "bailian.h"
#include "semantic/error_extractor.h"
#include <QDateTime>
#include <QJsonDocument>

BailianOutbound::BailianOutbound(const UpstreamConfig& config)
    : m_config(config)
{
}

NativeRequest BailianOutbound::translateRequest(const ChatRequest& request) const
{
    NativeRequest native;
    if (request.messages.size() == 1
        && request.messages.first().role == QStringLiteral("user")) {
        native.prompt = request.messages.first().content;
    } else {
        for (const ChatMessage& msg : request.messages)
            native.messages.append(NativeMessage{msg.role, msg.content, msg.name});
    }
    native.parameters = request.sampling;
    return native;
}

QJsonArray BailianOutbound::buildMessages(const QList<NativeMessage>& messages)
{
    QJsonArray arr;
    for (const NativeMessage& msg : messages) {
        QJsonObject obj;
        obj[QStringLiteral("role")] = msg.role;
        obj[QStringLiteral("content")] = msg.content;
        if (!msg.name.isEmpty())
            obj[QStringLiteral("name")] = msg.name;
        arr.append(obj);
    }
    return arr;
}

QJsonObject BailianOutbound::buildParameters(const NativeParameters& parameters)
{
    QJsonObject obj;
    if (parameters.temperature.has_value())
        obj[QStringLiteral("temperature")] = parameters.temperature.value();
    if (parameters.topP.has_value())
        obj[QStringLiteral("top_p")] = parameters.topP.value();
    if (parameters.maxTokens.has_value())
        obj[QStringLiteral("max_tokens")] = parameters.maxTokens.value();
    if (!parameters.stop.isEmpty())
        obj[QStringLiteral("stop")] = QJsonArray::fromStringList(parameters.stop);
    if (parameters.presencePenalty.has_value())
        obj[QStringLiteral("presence_penalty")] = parameters.presencePenalty.value();
    if (parameters.frequencyPenalty.has_value())
        obj[QStringLiteral("frequency_penalty")] = parameters.frequencyPenalty.value();
    return obj;
}

QJsonObject BailianOutbound::encodeNativeRequest(const NativeRequest& request)
{
    QJsonObject input;
    if (request.prompt.has_value())
        input[QStringLiteral("prompt")] = request.prompt.value();
    else
        input[QStringLiteral("messages")] = buildMessages(request.messages);

    QJsonObject body;
    body[QStringLiteral("input")] = input;
    // Sent as {} when empty; the backend expects the key to be present
    body[QStringLiteral("parameters")] = buildParameters(request.parameters);
    body[QStringLiteral("debug")] = QJsonObject();
    return body;
}

ProviderRequest BailianOutbound::baseRequest(const QString& url, bool stream,
                                             const QString& clientAccept) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = url;
    pr.stream = stream;
    pr.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + m_config.apiKey;
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    pr.headers[QStringLiteral("User-Agent")] = QStringLiteral("bailian-gateway/1.0");

    if (stream)
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");
    else if (!clientAccept.isEmpty())
        pr.headers[QStringLiteral("Accept")] = clientAccept;
    else
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("application/json");
    return pr;
}

ProviderRequest BailianOutbound::buildRequest(const ChatRequest& request) const
{
    ProviderRequest pr = baseRequest(m_config.nativeEndpoint(), request.stream,
                                     request.metadata.value(QStringLiteral("accept")));
    pr.body = QJsonDocument(encodeNativeRequest(translateRequest(request)))
                  .toJson(QJsonDocument::Compact);
    return pr;
}

ProviderRequest BailianOutbound::buildCompatibleRequest(const QByteArray& body,
                                                        bool stream,
                                                        const QString& clientAccept) const
{
    ProviderRequest pr = baseRequest(m_config.compatibleEndpoint(), stream, clientAccept);
    pr.body = body;
    return pr;
}

Result<NativeResponse> BailianOutbound::parseFrame(const QByteArray& data)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Failed to parse Bailian response JSON: ") + err.errorString()));
    }
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Bailian response is not a JSON object")));
    }

    const QJsonObject root = doc.object();
    const QJsonObject output = root.value(QStringLiteral("output")).toObject();

    NativeResponse nr;
    nr.requestId = root.value(QStringLiteral("request_id")).toString();
    nr.output.text = output.value(QStringLiteral("text")).toString();
    nr.output.finishReason = output.value(QStringLiteral("finish_reason")).toString();
    nr.output.sessionId = output.value(QStringLiteral("session_id")).toString();

    const QJsonArray models = root.value(QStringLiteral("usage")).toObject()
                                  .value(QStringLiteral("models")).toArray();
    for (const QJsonValue& mv : models) {
        const QJsonObject m = mv.toObject();
        NativeModelUsage usage;
        usage.modelId = m.value(QStringLiteral("model_id")).toString();
        usage.inputTokens = m.value(QStringLiteral("input_tokens")).toInt();
        usage.outputTokens = m.value(QStringLiteral("output_tokens")).toInt();
        nr.usage.append(usage);
    }
    return nr;
}

Result<StandardResponse> BailianOutbound::parseResponse(const ProviderResponse& response,
                                                        const QString& model) const
{
    auto frame = parseFrame(response.body);
    if (!frame)
        return std::unexpected(frame.error());

    const NativeResponse& nr = frame.value();
    StandardResponse sr;
    sr.id = nr.requestId;
    sr.created = QDateTime::currentSecsSinceEpoch();
    sr.model = model;
    sr.content = nr.output.text;
    sr.finishReason = nr.output.finishReason.isEmpty()
        ? QStringLiteral("stop") : nr.output.finishReason;

    if (!nr.usage.isEmpty()) {
        const NativeModelUsage& u = nr.usage.first();
        sr.usage.promptTokens = u.inputTokens;
        sr.usage.completionTokens = u.outputTokens;
        sr.usage.totalTokens = u.inputTokens + u.outputTokens;
    }
    return sr;
}

NativeError BailianOutbound::parseNativeError(const QJsonObject& obj)
{
    NativeError e;
    e.code = obj.value(QStringLiteral("code")).toString();
    e.message = obj.value(QStringLiteral("message")).toString();
    e.requestId = obj.value(QStringLiteral("request_id")).toString();
    return e;
}

DomainFailure BailianOutbound::mapFailure(int httpStatus, const QByteArray& body) const
{
    const QByteArray json = ErrorExtractor::extract(body).value_or(body);

    NativeError native;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        native = parseNativeError(doc.object());
    } else {
        native.code = QStringLiteral("api_error");
        native.message = QStringLiteral("API请求失败");
    }

    return DomainFailure::upstream(httpStatus, native.code, native.message);
}
