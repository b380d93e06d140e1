#include "types.h"

QString chatRoleName(ChatRole role)
{
    switch (role) {
    case ChatRole::System:    return QStringLiteral("system");
    case ChatRole::User:      return QStringLiteral("user");
    case ChatRole::Assistant: return QStringLiteral("assistant");
    case ChatRole::Tool:      return QStringLiteral("tool");
    }
    return QStringLiteral("user");
}

QString finishReasonName(FinishReason reason)
{
    switch (reason) {
    case FinishReason::Stop:          return QStringLiteral("stop");
    case FinishReason::ClientTrimmed: return QStringLiteral("client-trimmed");
    case FinishReason::FunctionCall:  return QStringLiteral("function_call");
    case FinishReason::ToolCalls:     return QStringLiteral("tool_calls");
    case FinishReason::ContentFilter: return QStringLiteral("content_filter");
    case FinishReason::Length:        return QStringLiteral("length");
    case FinishReason::ServerError:   return QStringLiteral("error");
    case FinishReason::Unknown:       break;
    }
    return QStringLiteral("unknown");
}

FinishReason finishReasonFromWire(const QString& value)
{
    if (value == QStringLiteral("stop"))
        return FinishReason::Stop;
    if (value == QStringLiteral("length"))
        return FinishReason::Length;
    if (value == QStringLiteral("content_filter"))
        return FinishReason::ContentFilter;
    if (value == QStringLiteral("tool_calls"))
        return FinishReason::ToolCalls;
    if (value == QStringLiteral("function_call"))
        return FinishReason::FunctionCall;
    if (value == QStringLiteral("error") || value == QStringLiteral("server_error"))
        return FinishReason::ServerError;
    return FinishReason::Unknown;
}

QString filterCategoryName(FilterCategory category)
{
    switch (category) {
    case FilterCategory::Copyright:   return QStringLiteral("copyright");
    case FilterCategory::Prompt:      return QStringLiteral("prompt");
    case FilterCategory::Hate:        return QStringLiteral("hate");
    case FilterCategory::SelfHarm:    return QStringLiteral("self_harm");
    case FilterCategory::Sexual:      return QStringLiteral("sexual");
    case FilterCategory::Violence:    return QStringLiteral("violence");
    case FilterCategory::Unspecified: break;
    }
    return QStringLiteral("uncategorized");
}

FilterCategory filterCategoryFromWire(const QString& value)
{
    const QString v = value.trimmed().toLower();
    if (v == QStringLiteral("copyright") || v == QStringLiteral("snippy"))
        return FilterCategory::Copyright;
    if (v == QStringLiteral("prompt"))
        return FilterCategory::Prompt;
    if (v == QStringLiteral("hate"))
        return FilterCategory::Hate;
    if (v == QStringLiteral("self_harm") || v == QStringLiteral("selfharm"))
        return FilterCategory::SelfHarm;
    if (v == QStringLiteral("sexual"))
        return FilterCategory::Sexual;
    if (v == QStringLiteral("violence"))
        return FilterCategory::Violence;
    return FilterCategory::Unspecified;
}

QString chatLocationName(ChatLocation location)
{
    switch (location) {
    case ChatLocation::Panel:          return QStringLiteral("panel");
    case ChatLocation::Editor:         return QStringLiteral("editor");
    case ChatLocation::EditingSession: return QStringLiteral("editingSession");
    case ChatLocation::Notebook:       return QStringLiteral("notebook");
    case ChatLocation::Terminal:       return QStringLiteral("terminal");
    case ChatLocation::Agent:          return QStringLiteral("agent");
    case ChatLocation::ResponsesProxy: return QStringLiteral("responsesProxy");
    case ChatLocation::Other:          break;
    }
    return QStringLiteral("other");
}

QString locationToIntent(ChatLocation location)
{
    switch (location) {
    case ChatLocation::Panel:          return QStringLiteral("conversation-panel");
    case ChatLocation::Editor:         return QStringLiteral("conversation-inline");
    case ChatLocation::EditingSession: return QStringLiteral("conversation-edits");
    case ChatLocation::Notebook:       return QStringLiteral("conversation-notebook");
    case ChatLocation::Terminal:       return QStringLiteral("conversation-terminal");
    case ChatLocation::Agent:          return QStringLiteral("conversation-agent");
    case ChatLocation::ResponsesProxy: return QStringLiteral("responses-proxy");
    case ChatLocation::Other:          break;
    }
    return QStringLiteral("conversation-other");
}
