#include <QCoreApplication>
#include <QCommandLineParser>
#include <QProcessEnvironment>

#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/bailian.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/pipeline.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "proxy/proxy_server.h"
#include "config/config_store.h"
#include "core/log_manager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("bailian-gateway"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("OpenAI-compatible gateway for Aliyun Bailian applications"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("JSON configuration file."),
                                    QStringLiteral("path"));
    QCommandLineOption portOption(QStringList{QStringLiteral("p"), QStringLiteral("port")},
                                  QStringLiteral("Listen port (overrides PORT)."),
                                  QStringLiteral("port"));
    QCommandLineOption debugOption(QStringLiteral("debug"),
                                   QStringLiteral("Enable debug logging."));
    parser.addOption(configOption);
    parser.addOption(portOption);
    parser.addOption(debugOption);
    parser.process(app);

    // --- 2. Config ---
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    QString configPath = parser.value(configOption);
    if (configPath.isEmpty())
        configPath = env.value(QStringLiteral("BAILIAN_GATEWAY_CONFIG"));

    ConfigStore configStore;
    if (!configPath.isEmpty()) {
        auto loaded = configStore.load(configPath);
        if (!loaded) {
            LOG_ERROR(loaded.error().message);
            return 1;
        }
    }
    configStore.applyEnvironment(env);

    if (parser.isSet(portOption)) {
        bool ok = false;
        int port = parser.value(portOption).toInt(&ok);
        if (!ok) {
            LOG_ERROR(QStringLiteral("无效的端口: %1").arg(parser.value(portOption)));
            return 1;
        }
        configStore.setPort(port);
    }
    if (parser.isSet(debugOption))
        configStore.setDebugMode(true);

    auto valid = configStore.validate();
    if (!valid) {
        LOG_ERROR(valid.error().message);
        return 1;
    }
    const GatewayConfig config = configStore.config();

    // --- 3. Log ---
    LogManager::instance().initialize(config.runtime.logDir);
    LogManager::instance().setDebugEnabled(config.runtime.debugMode);
    LOG_INFO(QStringLiteral("bailian-gateway v%1 启动").arg(app.applicationVersion()));

    // --- 4. Connection pool + Executor ---
    auto& proxyServer = *new ProxyServer(&app);
    QtExecutor executor(proxyServer.connectionPool());
    executor.setRequestTimeout(config.transport.requestTimeout * 1000);
    executor.setStreamTimeout(config.transport.streamTimeout * 1000);

    // --- 5. Adapters ---
    OpenAIChatAdapter inbound;
    BailianOutbound outbound(config.upstream);

    // --- 6. Pipeline ---
    Pipeline pipeline(&inbound, &outbound, &executor, &app);
    pipeline.addMiddleware(std::make_unique<DebugMiddleware>(config.runtime.debugMode));

    // --- 7. Proxy server ---
    proxyServer.setPipeline(&pipeline);
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &proxyServer, &ProxyServer::stop);

    LOG_INFO(QStringLiteral("应用ID: %1").arg(config.upstream.appId));
    LOG_INFO(QStringLiteral("上游地址: %1 (%2)")
                 .arg(config.upstream.endpoint(),
                      config.upstream.useNativeApi ? QStringLiteral("原生API")
                                                   : QStringLiteral("兼容模式")));
    LOG_INFO(QStringLiteral("超时: 请求 %1s, 流式 %2s; 连接池: 空闲 %3/%4, 每主机最大 %5, 空闲超时 %6s")
                 .arg(config.transport.requestTimeout)
                 .arg(config.transport.streamTimeout)
                 .arg(config.transport.maxIdleConns)
                 .arg(config.transport.maxIdleConnsPerHost)
                 .arg(config.transport.maxConnsPerHost)
                 .arg(config.transport.idleConnTimeout));

    if (!proxyServer.start(config)) {
        LOG_ERROR(QStringLiteral("代理服务启动失败，端口: %1").arg(config.runtime.port));
        return 1;
    }

    return app.exec();
}
