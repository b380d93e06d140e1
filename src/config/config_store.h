#pragma once
#include "config_types.h"
#include <QObject>
#include <QVariantMap>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // A missing or unreadable file leaves the defaults in place and returns false.
    bool load(const QString& path);
    bool reload();
    bool save();
    QString filePath() const { return m_filePath; }

    QVariantMap endpointOptions() const;
    void setEndpointOptions(const QVariantMap& opts);

    QString apiKey() const;
    void setApiKey(const QString& key);

    QVariantMap runtimeOptions() const;
    void setRuntimeOptions(const QVariantMap& opts);

    FetchConfig fetchConfig() const { return m_config; }
    EndpointConfig endpointConfig() const { return m_config.endpoint; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }

    static QString encodeApiKey(const QString& plain);
    static QString decodeApiKey(const QString& encoded);

signals:
    void configChanged();

private:
    FetchConfig m_config;
    QString m_filePath;
};
