#pragma once
#include <QtGlobal>
#include <QString>

enum class ChatRole : quint8 {
    System, User, Assistant, Tool
};

enum class PartKind : quint8 {
    Text, Image, ToolCall, ToolResult, Thinking
};

enum class FinishReason : quint8 {
    Stop,
    ClientTrimmed,
    FunctionCall,
    ToolCalls,
    ContentFilter,
    Length,
    ServerError,
    Unknown
};

// Why a completion was filtered. Copyright covers similarity to public code,
// the rest are safety categories.
enum class FilterCategory : quint8 {
    Copyright, Prompt, Hate, SelfHarm, Sexual, Violence, Unspecified
};

enum class ChatLocation : quint8 {
    Panel, Editor, EditingSession, Notebook, Terminal, Agent, Other, ResponsesProxy
};

// Which transport implementation carries a request.
enum class TransportHint : quint8 {
    Default, Alternate
};

QString chatRoleName(ChatRole role);
QString finishReasonName(FinishReason reason);
FinishReason finishReasonFromWire(const QString& value);
QString filterCategoryName(FilterCategory category);
FilterCategory filterCategoryFromWire(const QString& value);
QString chatLocationName(ChatLocation location);
QString locationToIntent(ChatLocation location);
