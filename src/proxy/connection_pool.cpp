#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ConnectionPool::ConnectionPool(const PoolLimits& limits)
    : m_limits(limits)
{
}

ConnectionPool::~ConnectionPool()
{
    clear();
}

void ConnectionPool::evictExpiredLocked()
{
    if (m_limits.idleTimeoutMs <= 0)
        return;

    int evicted = 0;
    for (auto it = m_idle.begin(); it != m_idle.end();) {
        if (it->since.hasExpired(m_limits.idleTimeoutMs)) {
            delete it->nam;
            it = m_idle.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        LOG_DEBUG(QStringLiteral("ConnectionPool: evicted %1 expired idle connection(s) (idle=%2)")
                      .arg(evicted)
                      .arg(m_idle.size()));
    }
}

void ConnectionPool::trimIdleLocked()
{
    while (m_idle.size() > qMax(0, m_limits.maxIdle))
        delete m_idle.dequeue().nam;
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QMutexLocker locker(&m_mutex);
    evictExpiredLocked();

    // Prefer returning an idle connection to avoid creating new TCP/TLS sessions
    if (!m_idle.isEmpty()) {
        QNetworkAccessManager* nam = m_idle.dequeue().nam;
        m_active.insert(nam);
        LOG_DEBUG(QStringLiteral("ConnectionPool: reused idle connection (active=%1, idle=%2)")
                      .arg(m_active.size())
                      .arg(m_idle.size()));
        return nam;
    }

    if (m_active.size() >= m_limits.maxActive) {
        LOG_WARNING(QStringLiteral("ConnectionPool: max active %1 exceeded, "
                                   "creating overflow connection (active=%2)")
                        .arg(m_limits.maxActive)
                        .arg(m_active.size()));
    }

    auto* nam = new QNetworkAccessManager;
    m_active.insert(nam);
    LOG_DEBUG(QStringLiteral("ConnectionPool: created new connection (active=%1, idle=%2)")
                  .arg(m_active.size())
                  .arg(m_idle.size()));
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    QMutexLocker locker(&m_mutex);
    if (!nam) {
        return;
    }

    if (!m_active.remove(nam)) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release called on untracked NAM, deleting"));
        delete nam;
        return;
    }

    if (m_idle.size() >= m_limits.maxIdle) {
        LOG_DEBUG(QStringLiteral("ConnectionPool: idle pool full (max=%1), discarding connection")
                      .arg(m_limits.maxIdle));
        delete nam;
        return;
    }

    IdleEntry entry;
    entry.nam = nam;
    entry.since.start();
    m_idle.enqueue(entry);
    LOG_DEBUG(QStringLiteral("ConnectionPool: returned connection to idle pool "
                             "(active=%1, idle=%2)")
                  .arg(m_active.size())
                  .arg(m_idle.size()));
}

void ConnectionPool::clear()
{
    QMutexLocker locker(&m_mutex);
    for (const IdleEntry& entry : m_idle) {
        delete entry.nam;
    }
    m_idle.clear();

    for (QNetworkAccessManager* nam : m_active) {
        delete nam;
    }
    m_active.clear();

    LOG_DEBUG(QStringLiteral("ConnectionPool: all connections cleared"));
}

void ConnectionPool::setLimits(const PoolLimits& limits)
{
    QMutexLocker locker(&m_mutex);
    m_limits = limits;
    trimIdleLocked();
    LOG_DEBUG(QStringLiteral("ConnectionPool: limits set to idle=%1 active=%2 idle_timeout=%3ms")
                  .arg(m_limits.maxIdle)
                  .arg(m_limits.maxActive)
                  .arg(m_limits.idleTimeoutMs));
}

PoolLimits ConnectionPool::limits() const
{
    QMutexLocker locker(&m_mutex);
    return m_limits;
}

int ConnectionPool::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active.size();
}

int ConnectionPool::idleCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_idle.size();
}
