#pragma once
#include <QString>

struct UpstreamConfig {
    QString appId;
    QString apiKey;
    QString baseUrl = "https://dashscope.aliyuncs.com";
    bool useNativeApi = true;

    QString nativeEndpoint() const {
        return QStringLiteral("%1/api/v1/apps/%2/completion").arg(baseUrl, appId);
    }

    QString compatibleEndpoint() const {
        return QStringLiteral("%1/api/v2/apps/agent/%2/compatible-mode/v1/chat/completions")
            .arg(baseUrl, appId);
    }

    QString endpoint() const {
        return useNativeApi ? nativeEndpoint() : compatibleEndpoint();
    }

    bool isValid() const {
        return !appId.isEmpty() && !apiKey.isEmpty();
    }
};

// All durations in seconds.
struct TransportOptions {
    int requestTimeout = 180;
    int streamTimeout = 600;
    int maxIdleConns = 100;
    int maxIdleConnsPerHost = 50;
    int maxConnsPerHost = 100;
    int idleConnTimeout = 90;
};

struct RuntimeOptions {
    int port = 8080;
    bool debugMode = false;
    QString logDir;
};

struct GatewayConfig {
    UpstreamConfig upstream;
    TransportOptions transport;
    RuntimeOptions runtime;

    bool isValid() const {
        return upstream.isValid();
    }
};
