#pragma once
#include "types.h"
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

struct ImageRef {
    QString mimeType;
    QString url;
    QByteArray inlineData;
    QString detail;
};

struct ToolCall {
    QString callId;
    QString name;
    QString arguments;
};

struct ContentPart {
    PartKind kind = PartKind::Text;
    QString text;
    ImageRef image;
    ToolCall toolCall;
    QString toolCallId;

    static ContentPart fromText(const QString& text) {
        ContentPart p;
        p.text = text;
        return p;
    }
    static ContentPart fromImage(const ImageRef& ref) {
        ContentPart p;
        p.kind = PartKind::Image;
        p.image = ref;
        return p;
    }
    static ContentPart fromToolCall(const ToolCall& call) {
        ContentPart p;
        p.kind = PartKind::ToolCall;
        p.toolCall = call;
        return p;
    }
    static ContentPart fromToolResult(const QString& callId, const QString& output) {
        ContentPart p;
        p.kind = PartKind::ToolResult;
        p.toolCallId = callId;
        p.text = output;
        return p;
    }
    static ContentPart fromThinking(const QString& text) {
        ContentPart p;
        p.kind = PartKind::Thinking;
        p.text = text;
        return p;
    }
};

struct ChatMessage {
    ChatRole role = ChatRole::User;
    QList<ContentPart> content;
    QString name;

    static ChatMessage user(const QString& text) {
        return ChatMessage{ChatRole::User, {ContentPart::fromText(text)}, {}};
    }
    static ChatMessage system(const QString& text) {
        return ChatMessage{ChatRole::System, {ContentPart::fromText(text)}, {}};
    }
    static ChatMessage assistant(const QString& text) {
        return ChatMessage{ChatRole::Assistant, {ContentPart::fromText(text)}, {}};
    }

    // Concatenation of the text parts, thinking and tool parts excluded.
    QString textContent() const {
        QString out;
        for (const auto& part : content) {
            if (part.kind == PartKind::Text)
                out += part.text;
        }
        return out;
    }

    bool hasImage() const {
        for (const auto& part : content) {
            if (part.kind == PartKind::Image)
                return true;
        }
        return false;
    }
};
