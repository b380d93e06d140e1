#include "failure.h"

TransportError TransportError::aborted(const QString& msg) {
    return {TransportErrorKind::Aborted, msg, 0};
}

TransportError TransportError::internetDisconnected(const QString& msg, int code) {
    return {TransportErrorKind::InternetDisconnected, msg, code};
}

TransportError TransportError::networkChanged(const QString& msg, int code) {
    return {TransportErrorKind::NetworkChanged, msg, code};
}

TransportError TransportError::prematureClose(const QString& msg) {
    return {TransportErrorKind::PrematureClose, msg, 0};
}

TransportError TransportError::fetcher(const QString& msg, int code) {
    return {TransportErrorKind::Fetcher, msg, code};
}

TransportError TransportError::generic(const QString& msg, int code) {
    return {TransportErrorKind::Generic, msg, code};
}

ChatRequestFailed ChatRequestFailed::validationFailed(const QString& reason) {
    ChatRequestFailed f;
    f.failKind = FailKind::ValidationFailed;
    f.reason = reason;
    return f;
}

ChatRequestFailed ChatRequestFailed::missingKey() {
    ChatRequestFailed f;
    f.failKind = FailKind::TokenExpiredOrInvalid;
    f.reason = QStringLiteral("key is missing");
    return f;
}

QString failKindName(FailKind kind) {
    switch (kind) {
    case FailKind::ValidationFailed:      return QStringLiteral("validationFailed");
    case FailKind::OffTopic:              return QStringLiteral("offTopic");
    case FailKind::InvalidStatefulMarker: return QStringLiteral("invalidStatefulMarker");
    case FailKind::AgentUnauthorized:     return QStringLiteral("agentUnauthorized");
    case FailKind::TokenExpiredOrInvalid: return QStringLiteral("tokenExpiredOrInvalid");
    case FailKind::QuotaExceeded:         return QStringLiteral("quotaExceeded");
    case FailKind::NotFound:              return QStringLiteral("notFound");
    case FailKind::ContentFilter:         return QStringLiteral("contentFilter");
    case FailKind::AgentFailedDependency: return QStringLiteral("agentFailedDependency");
    case FailKind::ExtensionBlocked:      return QStringLiteral("extensionBlocked");
    case FailKind::RateLimited:           return QStringLiteral("rateLimited");
    case FailKind::ClientNotSupported:    return QStringLiteral("clientNotSupported");
    case FailKind::ServerCanceled:        return QStringLiteral("serverCanceled");
    case FailKind::ServerError:           return QStringLiteral("serverError");
    case FailKind::Unknown:               break;
    }
    return QStringLiteral("unknown");
}

QString transportErrorKindName(TransportErrorKind kind) {
    switch (kind) {
    case TransportErrorKind::Aborted:              return QStringLiteral("aborted");
    case TransportErrorKind::InternetDisconnected: return QStringLiteral("internetDisconnected");
    case TransportErrorKind::NetworkChanged:       return QStringLiteral("networkChanged");
    case TransportErrorKind::PrematureClose:       return QStringLiteral("prematureClose");
    case TransportErrorKind::Fetcher:              return QStringLiteral("fetcher");
    case TransportErrorKind::Generic:              break;
    }
    return QStringLiteral("generic");
}
