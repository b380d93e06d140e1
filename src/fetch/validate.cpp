#include "validate.h"
#include <QRegularExpression>

namespace {

QString asUnexpected(const QString& reason) {
    return QStringLiteral("Prompt failed validation with the reason: %1. Please file an issue.")
        .arg(reason);
}

}

namespace Validate {

bool isValidFunctionName(const QString& name) {
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_-]+$"));
    return pattern.match(name).hasMatch();
}

ValidationResult chatPayload(const QList<ChatMessage>& messages,
                             const RequestOptions& options,
                             int hardToolLimit) {
    if (messages.isEmpty())
        return std::unexpected(ChatRequestFailed::validationFailed(
            asUnexpected(QStringLiteral("No messages provided"))));

    if (options.maxTokens.has_value() && options.maxTokens.value() < 1)
        return std::unexpected(ChatRequestFailed::validationFailed(
            asUnexpected(QStringLiteral("Invalid response token parameter"))));

    bool badName = false;
    for (const auto& fn : options.functions) {
        if (!isValidFunctionName(fn.name))
            badName = true;
    }
    for (const auto& tool : options.tools) {
        if (!isValidFunctionName(tool.function.name))
            badName = true;
    }
    if (options.functionCallName.has_value() && !isValidFunctionName(*options.functionCallName))
        badName = true;
    if (badName)
        return std::unexpected(ChatRequestFailed::validationFailed(
            asUnexpected(QStringLiteral("Function names must match ^[a-zA-Z0-9_-]+$"))));

    const int toolCount = options.tools.size();
    if (toolCount > hardToolLimit)
        return std::unexpected(ChatRequestFailed::validationFailed(
            QStringLiteral("Tool limit exceeded (%1/%2). Disable %3 tools and retry.")
                .arg(toolCount)
                .arg(hardToolLimit)
                .arg(toolCount - hardToolLimit)));

    return {};
}

}
