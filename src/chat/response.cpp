#include "response.h"

QString chatResponseTypeName(ChatResponseType type)
{
    switch (type) {
    case ChatResponseType::Success:               return QStringLiteral("success");
    case ChatResponseType::FilteredRetry:         return QStringLiteral("filteredRetry");
    case ChatResponseType::Filtered:              return QStringLiteral("filtered");
    case ChatResponseType::Length:                return QStringLiteral("length");
    case ChatResponseType::RateLimited:           return QStringLiteral("rateLimited");
    case ChatResponseType::QuotaExceeded:         return QStringLiteral("quotaExceeded");
    case ChatResponseType::TokenExpiredOrInvalid: return QStringLiteral("tokenExpiredOrInvalid");
    case ChatResponseType::BadRequest:            return QStringLiteral("badRequest");
    case ChatResponseType::NotFound:              return QStringLiteral("notFound");
    case ChatResponseType::PromptFiltered:        return QStringLiteral("promptFiltered");
    case ChatResponseType::OffTopic:              return QStringLiteral("offTopic");
    case ChatResponseType::ServerError:           return QStringLiteral("serverError");
    case ChatResponseType::Failed:                return QStringLiteral("failed");
    case ChatResponseType::NetworkError:          return QStringLiteral("networkError");
    case ChatResponseType::Canceled:              return QStringLiteral("canceled");
    case ChatResponseType::ExtensionBlocked:      return QStringLiteral("extensionBlocked");
    case ChatResponseType::AgentUnauthorized:     return QStringLiteral("agentUnauthorized");
    case ChatResponseType::AgentFailedDependency: return QStringLiteral("agentFailedDependency");
    case ChatResponseType::InvalidStatefulMarker: return QStringLiteral("invalidStatefulMarker");
    case ChatResponseType::Unknown:               break;
    }
    return QStringLiteral("unknown");
}
