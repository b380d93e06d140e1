#pragma once
#include "chat/completion.h"
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <optional>

struct ChoiceUpdate {
    int index = 0;
    ResponseDelta delta;
};

// Folds decoded chat-completion chunks into one ChatCompletion per choice.
// apply() returns the visible deltas of the chunk in payload order so the
// caller can forward them before the next chunk is read.
class CompletionAccumulator {
public:
    explicit CompletionAccumulator(int expectedChoices = 1);

    QList<ChoiceUpdate> apply(const QJsonObject& chunk);

    // Cuts the text of `index` at `offset` and finishes it as ClientTrimmed.
    void trim(int index, int offset);

    void setRequestIds(const ModelRequestId& ids) { m_ids = ids; }

    QString text(int index) const;
    bool isFinished(int index) const;
    // True once every expected choice has a finish reason.
    bool allFinished() const;
    bool hasTrimmed() const { return m_trimmed; }
    QString streamError() const { return m_streamError; }

    QList<ChatCompletion> finalize() const;

private:
    struct ChoiceState {
        ChatCompletion completion;
        QString text;
        QString thinking;
        QList<ToolCall> toolCalls;
        QMap<int, int> toolCallBySlot;   // wire slot -> index in toolCalls
        bool finished = false;
    };

    int m_expectedChoices;
    QMap<int, ChoiceState> m_states;
    std::optional<Usage> m_usage;
    QString m_model;
    QString m_completionId;
    QString m_created;
    ModelRequestId m_ids;
    QString m_streamError;
    bool m_trimmed = false;

    ChoiceState& stateFor(int index);
    void applyToolCallDelta(ChoiceState& state, const ToolCallDelta& delta);
    void failUnfinished(const QString& message);

    static std::optional<FilterCategory> filteredCategory(const QJsonObject& choice);
    static Usage parseUsage(const QJsonObject& usage);
};
