#pragma once
#include <QElapsedTimer>
#include <QNetworkAccessManager>
#include <QQueue>
#include <QSet>
#include <QMutex>

struct PoolLimits {
    int maxIdle = 50;            // managers kept for reuse
    int maxActive = 100;         // soft cap, overflow is served and logged
    int idleTimeoutMs = 90000;   // idle managers older than this are dropped
};

class ConnectionPool {
public:
    explicit ConnectionPool(const PoolLimits& limits = PoolLimits());
    ~ConnectionPool();

    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);
    void clear();
    void setLimits(const PoolLimits& limits);
    PoolLimits limits() const;
    int activeCount() const;
    int idleCount() const;

private:
    struct IdleEntry {
        QNetworkAccessManager* nam = nullptr;
        QElapsedTimer since;
    };

    PoolLimits m_limits;
    QQueue<IdleEntry> m_idle;
    QSet<QNetworkAccessManager*> m_active;
    mutable QMutex m_mutex;

    void evictExpiredLocked();
    void trimIdleLocked();
};
