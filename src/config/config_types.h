#pragma once
#include <QString>

struct EndpointConfig {
    QString baseUrl;
    QString route = QStringLiteral("/chat/completions");
    QString model;
    QString apiType = QStringLiteral("chat_completions");
    int maxOutputTokens = 4096;
    int modelMaxPromptTokens = 128000;
    bool supportsVision = false;

    QString url() const {
        QString base = baseUrl;
        while (base.endsWith(QLatin1Char('/')))
            base.chop(1);
        // Guard against double-append when the base already carries the route.
        if (route.isEmpty() || base.endsWith(route))
            return base;
        return route.startsWith(QLatin1Char('/')) ? base + route : base + QLatin1Char('/') + route;
    }

    bool isValid() const {
        return !baseUrl.isEmpty() && !model.isEmpty();
    }
};

struct AuthConfig {
    QString apiKey;
};

struct RuntimeOptions {
    int requestTimeout = 120000;
    int connectionPoolSize = 10;
    bool enableHttp2 = true;
    int hardToolLimit = 128;
    bool enableRetryOnFilter = true;
    bool enableRetryOnError = true;
    double temperature = 0.1;
    double topP = 1.0;
    bool debugLogging = false;
    QString logDir;
};

struct FetchConfig {
    EndpointConfig endpoint;
    AuthConfig auth;
    RuntimeOptions runtime;

    bool isValid() const {
        return endpoint.isValid();
    }
};
