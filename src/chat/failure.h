#pragma once
#include "completion.h"
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <optional>

enum class FailKind : quint8 {
    ValidationFailed,
    OffTopic,
    InvalidStatefulMarker,
    AgentUnauthorized,
    TokenExpiredOrInvalid,   // 401/403, credential gets invalidated
    QuotaExceeded,           // 402, credential gets invalidated
    NotFound,
    ContentFilter,           // 422, prompt-side filter
    AgentFailedDependency,
    ExtensionBlocked,
    RateLimited,             // 429, and 503 as an upstream rate limit
    ClientNotSupported,
    ServerCanceled,
    ServerError,
    Unknown
};

enum class TransportErrorKind : quint8 {
    Aborted,
    InternetDisconnected,
    NetworkChanged,
    PrematureClose,
    Fetcher,
    Generic
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::Generic;
    QString message;
    int code = 0;

    static TransportError aborted(const QString& msg);
    static TransportError internetDisconnected(const QString& msg, int code = 0);
    static TransportError networkChanged(const QString& msg, int code = 0);
    static TransportError prematureClose(const QString& msg);
    static TransportError fetcher(const QString& msg, int code = 0);
    static TransportError generic(const QString& msg, int code = 0);
};

struct ChatRequestFailed {
    FailKind failKind = FailKind::Unknown;
    QString reason;
    ModelRequestId modelRequestId;
    QJsonObject errorData;
    std::optional<QDateTime> retryAfter;
    std::optional<int> retryAfterSeconds;
    QString rateLimitKey;
    QString authorizeUrl;

    bool invalidatesCredential() const {
        return failKind == FailKind::TokenExpiredOrInvalid || failKind == FailKind::QuotaExceeded;
    }

    static ChatRequestFailed validationFailed(const QString& reason);
    static ChatRequestFailed missingKey();
};

QString failKindName(FailKind kind);
QString transportErrorKindName(TransportErrorKind kind);
