#pragma once
#include "message.h"
#include "types.h"
#include <QList>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

struct Usage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
    int cachedPromptTokens = 0;
    int reasoningTokens = 0;
    int acceptedPredictionTokens = 0;
    int rejectedPredictionTokens = 0;
};

// Ids the server reports for one exchange. headerRequestId echoes (or
// replaces) the id we sent; serverRequestId is assigned by the provider.
struct ModelRequestId {
    QString headerRequestId;
    QString serverRequestId;
    QString completionId;
    QString created;
};

struct ChatCompletion {
    int index = 0;
    QString model;
    FinishReason finishReason = FinishReason::Unknown;
    ChatMessage message{ChatRole::Assistant, {}, {}};
    QStringList tokens;
    std::optional<Usage> usage;
    std::optional<FilterCategory> filterReason;
    ModelRequestId requestId;
    QString error;
};

struct ToolCallDelta {
    int index = 0;
    QString callId;
    QString name;
    QString argumentsPatch;
};

struct ResponseDelta {
    QString text;
    QList<ToolCallDelta> toolCalls;
    QString thinking;
    // Set on the synthetic delta sent when the engine is about to retry.
    QString retryReason;
};

// Invoked for every incremental delta, in arrival order. `text` is the full
// text received so far for candidate `index`. Returning a value asks the
// stream to stop and trim the candidate text at that offset.
using FinishedCallback =
    std::function<std::optional<int>(const QString& text, int index, const ResponseDelta& delta)>;
