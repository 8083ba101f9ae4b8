#pragma once
#include "config_types.h"
#include "semantic/ports.h"
#include <QProcessEnvironment>

// Gateway configuration: defaults, then an optional JSON file, then
// environment variables, each layer overriding the previous one.
class ConfigStore {
public:
    // Upper bound for request and stream timeouts, in seconds
    static constexpr int kMaxTimeoutSeconds = 86400;

    VoidResult load(const QString& path);
    void applyEnvironment(const QProcessEnvironment& env);
    VoidResult validate() const;

    void setPort(int port);
    void setDebugMode(bool enabled);

    const GatewayConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

    static QString normalizeBaseUrl(const QString& url);

private:
    GatewayConfig m_config;
    QString m_filePath;
};
