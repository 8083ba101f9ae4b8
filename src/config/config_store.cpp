#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

QString envString(const QProcessEnvironment& env, const char* key, const QString& fallback)
{
    const QString value = env.value(QString::fromLatin1(key));
    return value.isEmpty() ? fallback : value;
}

int envInt(const QProcessEnvironment& env, const char* key, int fallback)
{
    const QString value = env.value(QString::fromLatin1(key));
    if (value.isEmpty())
        return fallback;
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok) {
        LOG_WARNING(QStringLiteral("ConfigStore: %1=%2 is not an integer, keeping %3")
                        .arg(QString::fromLatin1(key), value)
                        .arg(fallback));
        return fallback;
    }
    return parsed;
}

bool envBool(const QProcessEnvironment& env, const char* key, bool fallback)
{
    const QString value = env.value(QString::fromLatin1(key)).trimmed().toLower();
    if (value.isEmpty())
        return fallback;
    return value == QStringLiteral("true") || value == QStringLiteral("1");
}

}

QString ConfigStore::normalizeBaseUrl(const QString& url) {
    QString normalized = url.trimmed();
    while (normalized.endsWith(QLatin1Char('/')))
        normalized.chop(1);
    return normalized;
}

VoidResult ConfigStore::load(const QString& path) {
    m_filePath = path;
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_unreadable"),
            QStringLiteral("无法读取配置文件 %1: %2").arg(path, file.errorString())));
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_invalid"),
            QStringLiteral("配置文件格式错误 %1: %2").arg(path, err.errorString())));
    }

    QJsonObject root = doc.object();

    // upstream
    QJsonObject up = root["upstream"].toObject();
    UpstreamConfig& u = m_config.upstream;
    u.appId = jsonStringEither(up, "app_id", "appId", u.appId);
    u.apiKey = jsonStringEither(up, "api_key", "apiKey", u.apiKey);
    u.baseUrl = normalizeBaseUrl(jsonStringEither(up, "base_url", "baseUrl", u.baseUrl));
    u.useNativeApi = jsonBoolEither(up, "use_native_api", "useNativeApi", u.useNativeApi);

    // transport
    QJsonObject tr = root["transport"].toObject();
    TransportOptions& t = m_config.transport;
    t.requestTimeout = jsonIntEither(tr, "request_timeout", "requestTimeout", t.requestTimeout);
    t.streamTimeout = jsonIntEither(tr, "stream_timeout", "streamTimeout", t.streamTimeout);
    t.maxIdleConns = jsonIntEither(tr, "max_idle_conns", "maxIdleConns", t.maxIdleConns);
    t.maxIdleConnsPerHost = jsonIntEither(tr, "max_idle_conns_per_host", "maxIdleConnsPerHost", t.maxIdleConnsPerHost);
    t.maxConnsPerHost = jsonIntEither(tr, "max_conns_per_host", "maxConnsPerHost", t.maxConnsPerHost);
    t.idleConnTimeout = jsonIntEither(tr, "idle_conn_timeout", "idleConnTimeout", t.idleConnTimeout);

    // runtime
    QJsonObject rt = root["runtime"].toObject();
    RuntimeOptions& r = m_config.runtime;
    r.port = jsonIntEither(rt, "port", "port", r.port);
    r.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", r.debugMode);
    r.logDir = jsonStringEither(rt, "log_dir", "logDir", r.logDir);

    return {};
}

void ConfigStore::applyEnvironment(const QProcessEnvironment& env) {
    UpstreamConfig& u = m_config.upstream;
    u.appId = envString(env, "ALIYUN_APP_ID", u.appId);
    u.apiKey = envString(env, "ALIYUN_API_KEY", u.apiKey);
    u.baseUrl = normalizeBaseUrl(envString(env, "ALIYUN_BASE_URL", u.baseUrl));
    if (env.contains(QStringLiteral("USE_NATIVE_API")) && !env.value(QStringLiteral("USE_NATIVE_API")).isEmpty())
        u.useNativeApi = env.value(QStringLiteral("USE_NATIVE_API")) == QStringLiteral("true");

    TransportOptions& t = m_config.transport;
    t.requestTimeout = envInt(env, "REQUEST_TIMEOUT", t.requestTimeout);
    t.streamTimeout = envInt(env, "STREAM_TIMEOUT", t.streamTimeout);
    t.maxIdleConns = envInt(env, "MAX_IDLE_CONNS", t.maxIdleConns);
    t.maxIdleConnsPerHost = envInt(env, "MAX_IDLE_CONNS_PER_HOST", t.maxIdleConnsPerHost);
    t.maxConnsPerHost = envInt(env, "MAX_CONNS_PER_HOST", t.maxConnsPerHost);
    t.idleConnTimeout = envInt(env, "IDLE_CONN_TIMEOUT", t.idleConnTimeout);

    RuntimeOptions& r = m_config.runtime;
    r.port = envInt(env, "PORT", r.port);
    r.debugMode = envBool(env, "DEBUG_MODE", r.debugMode);
    r.logDir = envString(env, "LOG_DIR", r.logDir);
}

void ConfigStore::setPort(int port) {
    m_config.runtime.port = port;
}

void ConfigStore::setDebugMode(bool enabled) {
    m_config.runtime.debugMode = enabled;
}

VoidResult ConfigStore::validate() const {
    if (m_config.upstream.appId.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_app_id"),
            QStringLiteral("必须设置 ALIYUN_APP_ID 环境变量")));
    if (m_config.upstream.apiKey.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_api_key"),
            QStringLiteral("必须设置 ALIYUN_API_KEY 环境变量")));
    if (m_config.runtime.port < 0 || m_config.runtime.port > 65535)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_port"),
            QStringLiteral("端口超出范围: %1").arg(m_config.runtime.port)));
    const TransportOptions& t = m_config.transport;
    if (t.requestTimeout <= 0 || t.streamTimeout <= 0)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_timeout"),
            QStringLiteral("超时时间必须大于 0")));
    if (t.requestTimeout > kMaxTimeoutSeconds || t.streamTimeout > kMaxTimeoutSeconds)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_timeout"),
            QStringLiteral("超时时间不能超过 %1 秒").arg(kMaxTimeoutSeconds)));
    return {};
}
