#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QDir>

namespace {

const QString kLogCategory = QStringLiteral("config");

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = QString())
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toString(fallback);
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

double jsonDoubleEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, double fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toDouble(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

bool mapContainsEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    return map.contains(QString::fromUtf8(snakeKey)) || map.contains(QString::fromUtf8(camelKey));
}

QVariant mapValueEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (map.contains(snake))
        return map.value(snake);
    return map.value(QString::fromUtf8(camelKey));
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

double clampDouble(double value, double minValue, double maxValue)
{
    return qBound(minValue, value, maxValue);
}

void clampRuntime(RuntimeOptions& rt)
{
    rt.requestTimeout = clampInt(rt.requestTimeout, 1000, 600000);
    rt.connectionPoolSize = clampInt(rt.connectionPoolSize, 1, 200);
    rt.hardToolLimit = clampInt(rt.hardToolLimit, 1, 1024);
    rt.temperature = clampDouble(rt.temperature, 0.0, 2.0);
    rt.topP = clampDouble(rt.topP, 0.0, 1.0);
}

void clampEndpoint(EndpointConfig& ep)
{
    ep.maxOutputTokens = clampInt(ep.maxOutputTokens, 1, 1000000);
    ep.modelMaxPromptTokens = clampInt(ep.modelMaxPromptTokens, 1, 10000000);
}

} // namespace

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    if (m_filePath.isEmpty()) {
        QString appData = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        QDir().mkpath(appData);
        m_filePath = appData + QStringLiteral("/config.json");
    }
    return reload();
}

bool ConfigStore::reload() {
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("No config at %1, using defaults").arg(m_filePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        LOG_CAT_WARNING(kLogCategory, QStringLiteral("Ignoring malformed config %1: %2")
                                          .arg(m_filePath, parseError.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();
    FetchConfig config;

    const QJsonObject ep = root.value(QStringLiteral("endpoint")).toObject();
    config.endpoint.baseUrl = jsonStringEither(ep, "base_url", "baseUrl");
    config.endpoint.route = jsonStringEither(ep, "route", "route", config.endpoint.route);
    config.endpoint.model = jsonStringEither(ep, "model", "model");
    config.endpoint.apiType = jsonStringEither(ep, "api_type", "apiType", config.endpoint.apiType);
    config.endpoint.maxOutputTokens = jsonIntEither(ep, "max_output_tokens", "maxOutputTokens", 4096);
    config.endpoint.modelMaxPromptTokens = jsonIntEither(ep, "model_max_prompt_tokens", "modelMaxPromptTokens", 128000);
    config.endpoint.supportsVision = jsonBoolEither(ep, "supports_vision", "supportsVision", false);
    clampEndpoint(config.endpoint);

    const QJsonObject auth = root.value(QStringLiteral("auth")).toObject();
    config.auth.apiKey = decodeApiKey(jsonStringEither(auth, "api_key", "apiKey"));

    const QJsonObject rt = root.value(QStringLiteral("runtime")).toObject();
    config.runtime.requestTimeout = jsonIntEither(rt, "request_timeout_ms", "requestTimeoutMs", 120000);
    config.runtime.connectionPoolSize = jsonIntEither(rt, "connection_pool_size", "connectionPoolSize", 10);
    config.runtime.enableHttp2 = jsonBoolEither(rt, "enable_http2", "enableHttp2", true);
    config.runtime.hardToolLimit = jsonIntEither(rt, "hard_tool_limit", "hardToolLimit", 128);
    config.runtime.enableRetryOnFilter = jsonBoolEither(rt, "enable_retry_on_filter", "enableRetryOnFilter", true);
    config.runtime.enableRetryOnError = jsonBoolEither(rt, "enable_retry_on_error", "enableRetryOnError", true);
    config.runtime.temperature = jsonDoubleEither(rt, "temperature", "temperature", 0.1);
    config.runtime.topP = jsonDoubleEither(rt, "top_p", "topP", 1.0);
    config.runtime.debugLogging = jsonBoolEither(rt, "debug_logging", "debugLogging", false);
    config.runtime.logDir = jsonStringEither(rt, "log_dir", "logDir");
    clampRuntime(config.runtime);

    m_config = config;
    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QJsonObject root;
    root["version"] = 1;

    QJsonObject ep;
    ep["base_url"] = m_config.endpoint.baseUrl;
    ep["route"] = m_config.endpoint.route;
    ep["model"] = m_config.endpoint.model;
    ep["api_type"] = m_config.endpoint.apiType;
    ep["max_output_tokens"] = m_config.endpoint.maxOutputTokens;
    ep["model_max_prompt_tokens"] = m_config.endpoint.modelMaxPromptTokens;
    ep["supports_vision"] = m_config.endpoint.supportsVision;
    root["endpoint"] = ep;

    QJsonObject auth;
    auth["api_key"] = encodeApiKey(m_config.auth.apiKey);
    root["auth"] = auth;

    QJsonObject rt;
    rt["request_timeout_ms"] = m_config.runtime.requestTimeout;
    rt["connection_pool_size"] = m_config.runtime.connectionPoolSize;
    rt["enable_http2"] = m_config.runtime.enableHttp2;
    rt["hard_tool_limit"] = m_config.runtime.hardToolLimit;
    rt["enable_retry_on_filter"] = m_config.runtime.enableRetryOnFilter;
    rt["enable_retry_on_error"] = m_config.runtime.enableRetryOnError;
    rt["temperature"] = m_config.runtime.temperature;
    rt["top_p"] = m_config.runtime.topP;
    rt["debug_logging"] = m_config.runtime.debugLogging;
    if (!m_config.runtime.logDir.isEmpty())
        rt["log_dir"] = m_config.runtime.logDir;
    root["runtime"] = rt;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_CAT_ERROR(kLogCategory, QStringLiteral("Cannot write config %1: %2")
                                        .arg(m_filePath, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

QVariantMap ConfigStore::endpointOptions() const {
    const EndpointConfig& ep = m_config.endpoint;
    QVariantMap map;
    map["base_url"] = ep.baseUrl;
    map["baseUrl"] = ep.baseUrl;
    map["route"] = ep.route;
    map["model"] = ep.model;
    map["api_type"] = ep.apiType;
    map["apiType"] = ep.apiType;
    map["max_output_tokens"] = ep.maxOutputTokens;
    map["maxOutputTokens"] = ep.maxOutputTokens;
    map["model_max_prompt_tokens"] = ep.modelMaxPromptTokens;
    map["modelMaxPromptTokens"] = ep.modelMaxPromptTokens;
    map["supports_vision"] = ep.supportsVision;
    map["supportsVision"] = ep.supportsVision;
    return map;
}

void ConfigStore::setEndpointOptions(const QVariantMap& opts) {
    EndpointConfig& ep = m_config.endpoint;
    if (mapContainsEither(opts, "base_url", "baseUrl"))
        ep.baseUrl = mapValueEither(opts, "base_url", "baseUrl").toString();
    if (opts.contains(QStringLiteral("route")))
        ep.route = opts.value(QStringLiteral("route")).toString();
    if (opts.contains(QStringLiteral("model")))
        ep.model = opts.value(QStringLiteral("model")).toString();
    if (mapContainsEither(opts, "api_type", "apiType"))
        ep.apiType = mapValueEither(opts, "api_type", "apiType").toString();
    if (mapContainsEither(opts, "max_output_tokens", "maxOutputTokens"))
        ep.maxOutputTokens = mapValueEither(opts, "max_output_tokens", "maxOutputTokens").toInt();
    if (mapContainsEither(opts, "model_max_prompt_tokens", "modelMaxPromptTokens"))
        ep.modelMaxPromptTokens = mapValueEither(opts, "model_max_prompt_tokens", "modelMaxPromptTokens").toInt();
    if (mapContainsEither(opts, "supports_vision", "supportsVision"))
        ep.supportsVision = mapValueEither(opts, "supports_vision", "supportsVision").toBool();
    clampEndpoint(ep);
    save();
    emit configChanged();
}

QString ConfigStore::apiKey() const {
    return m_config.auth.apiKey;
}

void ConfigStore::setApiKey(const QString& key) {
    m_config.auth.apiKey = key;
    save();
    emit configChanged();
}

QVariantMap ConfigStore::runtimeOptions() const {
    const RuntimeOptions& rt = m_config.runtime;
    QVariantMap map;
    map["request_timeout_ms"] = rt.requestTimeout;
    map["requestTimeoutMs"] = rt.requestTimeout;
    map["connection_pool_size"] = rt.connectionPoolSize;
    map["connectionPoolSize"] = rt.connectionPoolSize;
    map["enable_http2"] = rt.enableHttp2;
    map["enableHttp2"] = rt.enableHttp2;
    map["hard_tool_limit"] = rt.hardToolLimit;
    map["hardToolLimit"] = rt.hardToolLimit;
    map["enable_retry_on_filter"] = rt.enableRetryOnFilter;
    map["enableRetryOnFilter"] = rt.enableRetryOnFilter;
    map["enable_retry_on_error"] = rt.enableRetryOnError;
    map["enableRetryOnError"] = rt.enableRetryOnError;
    map["temperature"] = rt.temperature;
    map["top_p"] = rt.topP;
    map["topP"] = rt.topP;
    map["debug_logging"] = rt.debugLogging;
    map["debugLogging"] = rt.debugLogging;
    map["log_dir"] = rt.logDir;
    map["logDir"] = rt.logDir;
    return map;
}

void ConfigStore::setRuntimeOptions(const QVariantMap& opts) {
    RuntimeOptions& rt = m_config.runtime;
    if (mapContainsEither(opts, "request_timeout_ms", "requestTimeoutMs"))
        rt.requestTimeout = mapValueEither(opts, "request_timeout_ms", "requestTimeoutMs").toInt();
    if (mapContainsEither(opts, "connection_pool_size", "connectionPoolSize"))
        rt.connectionPoolSize = mapValueEither(opts, "connection_pool_size", "connectionPoolSize").toInt();
    if (mapContainsEither(opts, "enable_http2", "enableHttp2"))
        rt.enableHttp2 = mapValueEither(opts, "enable_http2", "enableHttp2").toBool();
    if (mapContainsEither(opts, "hard_tool_limit", "hardToolLimit"))
        rt.hardToolLimit = mapValueEither(opts, "hard_tool_limit", "hardToolLimit").toInt();
    if (mapContainsEither(opts, "enable_retry_on_filter", "enableRetryOnFilter"))
        rt.enableRetryOnFilter = mapValueEither(opts, "enable_retry_on_filter", "enableRetryOnFilter").toBool();
    if (mapContainsEither(opts, "enable_retry_on_error", "enableRetryOnError"))
        rt.enableRetryOnError = mapValueEither(opts, "enable_retry_on_error", "enableRetryOnError").toBool();
    if (opts.contains(QStringLiteral("temperature")))
        rt.temperature = opts.value(QStringLiteral("temperature")).toDouble();
    if (mapContainsEither(opts, "top_p", "topP"))
        rt.topP = mapValueEither(opts, "top_p", "topP").toDouble();
    if (mapContainsEither(opts, "debug_logging", "debugLogging"))
        rt.debugLogging = mapValueEither(opts, "debug_logging", "debugLogging").toBool();
    if (mapContainsEither(opts, "log_dir", "logDir"))
        rt.logDir = mapValueEither(opts, "log_dir", "logDir").toString();
    clampRuntime(rt);
    save();
    emit configChanged();
}

// Obfuscation only; keeps keys from showing up verbatim in the file.
QString ConfigStore::encodeApiKey(const QString& plain) {
    if (plain.isEmpty())
        return QString();
    return QStringLiteral("ENC:") + QString::fromUtf8(plain.toUtf8().toBase64());
}

QString ConfigStore::decodeApiKey(const QString& encoded) {
    if (encoded.startsWith(QStringLiteral("ENC:")))
        return QString::fromUtf8(QByteArray::fromBase64(encoded.mid(4).toUtf8()));
    return encoded;
}
