#pragma once
#include "config/config_types.h"
#include "semantic/native.h"
#include "semantic/ports.h"
#include "semantic/request.h"
#include "semantic/response.h"
#include <QJsonArray>
#include <QJsonObject>

// Aliyun Bailian application-completion backend. Translates standard
// requests into the native app protocol and native replies back.
class BailianOutbound {
public:
    explicit BailianOutbound(const UpstreamConfig& config);

    const UpstreamConfig& config() const { return m_config; }

    // A lone user message goes out as input.prompt, anything else as
    // input.messages.
    NativeRequest translateRequest(const ChatRequest& request) const;
    static QJsonObject encodeNativeRequest(const NativeRequest& request);

    ProviderRequest buildRequest(const ChatRequest& request) const;
    // Compatible mode forwards the client's body untouched.
    ProviderRequest buildCompatibleRequest(const QByteArray& body,
                                           bool stream,
                                           const QString& clientAccept) const;

    static Result<NativeResponse> parseFrame(const QByteArray& data);
    Result<StandardResponse> parseResponse(const ProviderResponse& response,
                                           const QString& model) const;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) const;

    static NativeError parseNativeError(const QJsonObject& obj);

protected:
    static QJsonArray buildMessages(const QList<NativeMessage>& messages);
    static QJsonObject buildParameters(const NativeParameters& parameters);
    ProviderRequest baseRequest(const QString& url, bool stream,
                                const QString& clientAccept) const;

private:
    UpstreamConfig m_config;
};
