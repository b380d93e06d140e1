#pragma once
#include "chat/ports.h"

// Character based estimate, roughly four characters per token plus a small
// per-message overhead. Only feeds telemetry.
class ApproxTokenizer : public ITokenizer {
public:
    int countMessagesTokens(const QList<ChatMessage>& messages) const override;

    static int countTextTokens(const QString& text);

    static constexpr int kCharsPerToken = 4;
    static constexpr int kPerMessageOverhead = 3;
    static constexpr int kImageTokens = 85;
};
