#include "approx_tokenizer.h"

int ApproxTokenizer::countTextTokens(const QString& text)
{
    if (text.isEmpty())
        return 0;
    return (text.size() + kCharsPerToken - 1) / kCharsPerToken;
}

int ApproxTokenizer::countMessagesTokens(const QList<ChatMessage>& messages) const
{
    int total = 0;
    for (const auto& message : messages) {
        total += kPerMessageOverhead + countTextTokens(message.name);
        for (const auto& part : message.content) {
            switch (part.kind) {
            case PartKind::Text:
            case PartKind::Thinking:
            case PartKind::ToolResult:
                total += countTextTokens(part.text);
                break;
            case PartKind::Image:
                total += kImageTokens;
                break;
            case PartKind::ToolCall:
                total += countTextTokens(part.toolCall.name) + countTextTokens(part.toolCall.arguments);
                break;
            }
        }
    }
    return total;
}
