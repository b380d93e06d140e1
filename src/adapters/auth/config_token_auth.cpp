#include "config_token_auth.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include <QMutexLocker>

namespace {
const QString kLogCategory = QStringLiteral("auth");
}

ConfigTokenAuth::ConfigTokenAuth(ConfigStore& store)
    : m_store(store)
{
}

QString ConfigTokenAuth::currentToken()
{
    QMutexLocker locker(&m_mutex);
    if (m_invalidated) {
        if (m_store.reload())
            LOG_CAT_INFO(kLogCategory, QStringLiteral("Re-read API key after invalidation"));
        m_invalidated = false;
    }
    return m_store.apiKey();
}

void ConfigTokenAuth::invalidateToken(int httpStatus)
{
    QMutexLocker locker(&m_mutex);
    m_invalidated = true;
    m_lastInvalidationStatus = httpStatus;
    LOG_CAT_WARNING(kLogCategory, QStringLiteral("API key rejected with status %1, will re-read on next request")
                                      .arg(httpStatus));
}

void ConfigTokenAuth::setSessionContinuationToken(const QString& token)
{
    QMutexLocker locker(&m_mutex);
    m_sessionToken = token;
}

bool ConfigTokenAuth::isInvalidated() const
{
    QMutexLocker locker(&m_mutex);
    return m_invalidated;
}

int ConfigTokenAuth::lastInvalidationStatus() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastInvalidationStatus;
}

QString ConfigTokenAuth::sessionContinuationToken() const
{
    QMutexLocker locker(&m_mutex);
    return m_sessionToken;
}
