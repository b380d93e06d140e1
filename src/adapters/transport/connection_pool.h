#pragma once
#include <QNetworkAccessManager>
#include <QQueue>
#include <QSet>
#include <QMutex>

// Keeps idle QNetworkAccessManager instances so that consecutive requests
// reuse their TCP/TLS (and HTTP/2) sessions. A disabled pool hands out a
// fresh manager per request and deletes it on release.
//
// Managers must be acquired and released on the thread that owns them.
class ConnectionPool {
public:
    explicit ConnectionPool(int maxSize = 10, bool enabled = true);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);
    void clear();

    bool isEnabled() const { return m_enabled; }
    int maxSize() const { return m_maxSize; }
    int activeCount() const;
    int idleCount() const;
    int createdCount() const;

private:
    const int m_maxSize;
    const bool m_enabled;
    int m_created = 0;
    QQueue<QNetworkAccessManager*> m_idle;
    QSet<QNetworkAccessManager*> m_active;
    mutable QMutex m_mutex;
};
