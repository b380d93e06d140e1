#pragma once
#include "chat/ports.h"
#include <QMutex>

class ConfigStore;

// Serves the API key held by the ConfigStore. An invalidated key is re-read
// from disk on the next currentToken() so an edited config file takes
// effect without a restart.
class ConfigTokenAuth : public IAuthService {
public:
    explicit ConfigTokenAuth(ConfigStore& store);

    QString currentToken() override;
    void invalidateToken(int httpStatus) override;
    void setSessionContinuationToken(const QString& token) override;

    bool isInvalidated() const;
    int lastInvalidationStatus() const;
    QString sessionContinuationToken() const;

private:
    ConfigStore& m_store;
    bool m_invalidated = false;
    int m_lastInvalidationStatus = 0;
    QString m_sessionToken;
    mutable QMutex m_mutex;
};
