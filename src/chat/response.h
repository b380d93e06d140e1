#pragma once
#include "completion.h"
#include "types.h"
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

enum class ChatResponseType : quint8 {
    Success,
    FilteredRetry,      // internal only, never returned from fetchMany
    Filtered,
    Length,
    RateLimited,
    QuotaExceeded,
    TokenExpiredOrInvalid,
    BadRequest,
    NotFound,
    PromptFiltered,
    OffTopic,
    ServerError,
    Failed,
    NetworkError,
    Canceled,
    ExtensionBlocked,
    AgentUnauthorized,
    AgentFailedDependency,
    InvalidStatefulMarker,
    Unknown
};

struct ChatResponse {
    ChatResponseType type = ChatResponseType::Unknown;
    QString reason;
    QString reasonDetail;
    QString requestId;
    QString serverRequestId;

    // Success / FilteredRetry
    QStringList value;
    QString resolvedModel;
    std::optional<Usage> usage;

    // Filtered / FilteredRetry / PromptFiltered
    std::optional<FilterCategory> category;

    // Length
    QString truncatedValue;

    // RateLimited / QuotaExceeded / ExtensionBlocked
    std::optional<QDateTime> retryAfter;
    std::optional<int> retryAfterSeconds;
    QString rateLimitKey;
    QJsonObject capiError;

    // AgentUnauthorized
    QString authorizationUrl;

    // ServerError reported inside the stream
    QString streamError;

    bool isSuccess() const { return type == ChatResponseType::Success; }
};

QString chatResponseTypeName(ChatResponseType type);
