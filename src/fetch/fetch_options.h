#pragma once
#include "chat/completion.h"
#include "chat/message.h"
#include "chat/request.h"
#include "chat/types.h"
#include <QList>
#include <QString>
#include <optional>

class IChatEndpoint;

struct FetchOptions {
    QString debugName;
    IChatEndpoint* endpoint = nullptr;
    QList<ChatMessage> messages;
    RequestOptions requestOptions;
    ChatLocation location = ChatLocation::Panel;
    FinishedCallback finishedCb;
    TelemetryProperties telemetryProperties;
    QString sourceId;
    bool userInitiatedRequest = false;
    bool enableRetryOnFilter = false;
    // Falls back to enableRetryOnFilter when unset.
    std::optional<bool> enableRetryOnError;
    bool ignoreStatefulMarker = false;
    TransportHint transport = TransportHint::Default;

    bool retryOnErrorEnabled() const { return enableRetryOnError.value_or(enableRetryOnFilter); }
};
