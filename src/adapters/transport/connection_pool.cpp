#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>

namespace {
const QString kLogCategory = QStringLiteral("transport");
}

ConnectionPool::ConnectionPool(int maxSize, bool enabled)
    : m_maxSize(qMax(1, maxSize))
    , m_enabled(enabled)
{
}

ConnectionPool::~ConnectionPool()
{
    clear();
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QMutexLocker locker(&m_mutex);

    if (m_enabled && !m_idle.isEmpty()) {
        QNetworkAccessManager* nam = m_idle.dequeue();
        m_active.insert(nam);
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("ConnectionPool: reused idle manager (active=%1, idle=%2)")
                                        .arg(m_active.size())
                                        .arg(m_idle.size()));
        return nam;
    }

    if (m_enabled && m_active.size() >= m_maxSize) {
        LOG_CAT_WARNING(kLogCategory, QStringLiteral("ConnectionPool: max pool size %1 exceeded, "
                                                     "creating overflow manager (active=%2)")
                                          .arg(m_maxSize)
                                          .arg(m_active.size()));
    }

    auto* nam = new QNetworkAccessManager;
    m_active.insert(nam);
    ++m_created;
    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("ConnectionPool: created manager (active=%1, idle=%2, pooled=%3)")
                                    .arg(m_active.size())
                                    .arg(m_idle.size())
                                    .arg(m_enabled ? QStringLiteral("yes") : QStringLiteral("no")));
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam)
        return;

    QMutexLocker locker(&m_mutex);
    if (!m_active.remove(nam)) {
        LOG_CAT_WARNING(kLogCategory, QStringLiteral("ConnectionPool: release called on untracked manager, deleting"));
        delete nam;
        return;
    }

    if (!m_enabled) {
        delete nam;
        return;
    }

    // Over capacity: destroy instead of returning to the idle queue.
    const int totalAfterReturn = m_idle.size() + m_active.size() + 1;
    if (totalAfterReturn > m_maxSize) {
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("ConnectionPool: discarding overflow manager "
                                                   "(total would be %1, max=%2)")
                                        .arg(totalAfterReturn)
                                        .arg(m_maxSize));
        delete nam;
        return;
    }
    m_idle.enqueue(nam);
}

void ConnectionPool::clear()
{
    QMutexLocker locker(&m_mutex);
    qDeleteAll(m_idle);
    m_idle.clear();
    qDeleteAll(m_active);
    m_active.clear();
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

int ConnectionPool::createdCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_created;
}
