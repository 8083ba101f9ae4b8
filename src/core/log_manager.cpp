#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString currentTimestamp()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/bailian-gateway.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::setDebugEnabled(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_debugEnabled = enabled;
}

bool LogManager::isDebugEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_debugEnabled;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    const QString timestamp = currentTimestamp();
    const QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);

    {
        QMutexLocker locker(&m_mutex);
        if (level == Debug && !m_debugEnabled)
            return;

        // stderr is the primary sink; the file is optional
        QTextStream err(stderr);
        err << formatted << "\n";
        err.flush();

        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    return QString("[%1] [%2] [%3] %4")
        .arg(currentTimestamp(), kLevelNames[level], category, message);
}
