#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    void initialize(const QString& logDir);
    void setDebugEnabled(bool enabled);
    bool isDebugEnabled() const;

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "gateway", msg); }
    void info(const QString& msg)    { log(Info, "gateway", msg); }
    void warning(const QString& msg) { log(Warning, "gateway", msg); }
    void error(const QString& msg)   { log(Error, "gateway", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    bool m_debugEnabled = false;
    mutable QMutex m_mutex;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
