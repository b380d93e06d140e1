#include "completion_accumulator.h"
#include <QJsonArray>
#include <QJsonValue>

CompletionAccumulator::CompletionAccumulator(int expectedChoices)
    : m_expectedChoices(qMax(1, expectedChoices))
{
}

CompletionAccumulator::ChoiceState& CompletionAccumulator::stateFor(int index)
{
    auto it = m_states.find(index);
    if (it == m_states.end()) {
        ChoiceState state;
        state.completion.index = index;
        it = m_states.insert(index, state);
    }
    return it.value();
}

// ---------------------------------------------------------------------------
// Chunk ingestion
// ---------------------------------------------------------------------------

QList<ChoiceUpdate> CompletionAccumulator::apply(const QJsonObject& chunk)
{
    QList<ChoiceUpdate> updates;

    if (m_completionId.isEmpty())
        m_completionId = chunk.value(QStringLiteral("id")).toString();
    if (m_created.isEmpty() && chunk.contains(QStringLiteral("created")))
        m_created = QString::number(chunk.value(QStringLiteral("created")).toInteger());
    const QString model = chunk.value(QStringLiteral("model")).toString();
    if (!model.isEmpty())
        m_model = model;

    const QJsonObject usage = chunk.value(QStringLiteral("usage")).toObject();
    if (!usage.isEmpty())
        m_usage = parseUsage(usage);

    const QJsonValue error = chunk.value(QStringLiteral("error"));
    if (error.isObject() || error.isString()) {
        const QString message = error.isObject()
            ? error.toObject().value(QStringLiteral("message")).toString()
            : error.toString();
        failUnfinished(message.isEmpty() ? QStringLiteral("unknown stream error") : message);
        return updates;
    }

    const QJsonArray choices = chunk.value(QStringLiteral("choices")).toArray();
    for (const QJsonValue& cv : choices) {
        const QJsonObject choice = cv.toObject();
        const int index = choice.value(QStringLiteral("index")).toInt();
        ChoiceState& state = stateFor(index);
        if (state.finished)
            continue;

        const QJsonObject delta = choice.value(QStringLiteral("delta")).toObject();
        ChoiceUpdate update;
        update.index = index;

        const QString content = delta.value(QStringLiteral("content")).toString();
        if (!content.isEmpty()) {
            state.text += content;
            state.completion.tokens.append(content);
            update.delta.text = content;
        }

        QString reasoning = delta.value(QStringLiteral("reasoning_content")).toString();
        if (reasoning.isEmpty())
            reasoning = delta.value(QStringLiteral("reasoning")).toString();
        if (!reasoning.isEmpty()) {
            state.thinking += reasoning;
            update.delta.thinking = reasoning;
        }

        const QJsonArray toolCalls = delta.value(QStringLiteral("tool_calls")).toArray();
        for (const QJsonValue& tcv : toolCalls) {
            const QJsonObject tc = tcv.toObject();
            const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
            ToolCallDelta tcDelta;
            tcDelta.index = tc.value(QStringLiteral("index")).toInt();
            tcDelta.callId = tc.value(QStringLiteral("id")).toString();
            tcDelta.name = fn.value(QStringLiteral("name")).toString();
            tcDelta.argumentsPatch = fn.value(QStringLiteral("arguments")).toString();
            applyToolCallDelta(state, tcDelta);
            update.delta.toolCalls.append(tcDelta);
        }

        // Legacy single function call, tracked in its own slot.
        const QJsonObject functionCall = delta.value(QStringLiteral("function_call")).toObject();
        if (!functionCall.isEmpty()) {
            ToolCallDelta fcDelta;
            fcDelta.index = -1;
            fcDelta.name = functionCall.value(QStringLiteral("name")).toString();
            fcDelta.argumentsPatch = functionCall.value(QStringLiteral("arguments")).toString();
            applyToolCallDelta(state, fcDelta);
            update.delta.toolCalls.append(fcDelta);
        }

        if (!update.delta.text.isEmpty() || !update.delta.thinking.isEmpty()
            || !update.delta.toolCalls.isEmpty()) {
            updates.append(update);
        }

        const QString finishReason = choice.value(QStringLiteral("finish_reason")).toString();
        if (!finishReason.isEmpty()) {
            state.finished = true;
            state.completion.finishReason = finishReasonFromWire(finishReason);
            if (state.completion.finishReason == FinishReason::ContentFilter)
                state.completion.filterReason = filteredCategory(choice);
        }
    }

    return updates;
}

void CompletionAccumulator::applyToolCallDelta(ChoiceState& state, const ToolCallDelta& delta)
{
    auto it = state.toolCallBySlot.find(delta.index);
    if (it == state.toolCallBySlot.end()) {
        state.toolCalls.append(ToolCall{delta.callId, delta.name, delta.argumentsPatch});
        state.toolCallBySlot.insert(delta.index, state.toolCalls.size() - 1);
        return;
    }

    ToolCall& existing = state.toolCalls[it.value()];
    existing.arguments.append(delta.argumentsPatch);
    if (existing.callId.isEmpty())
        existing.callId = delta.callId;
    if (existing.name.isEmpty())
        existing.name = delta.name;
}

void CompletionAccumulator::failUnfinished(const QString& message)
{
    m_streamError = message;
    if (m_states.isEmpty())
        stateFor(0);
    for (auto it = m_states.begin(); it != m_states.end(); ++it) {
        if (it->finished)
            continue;
        it->finished = true;
        it->completion.finishReason = FinishReason::ServerError;
        it->completion.error = message;
    }
}

void CompletionAccumulator::trim(int index, int offset)
{
    ChoiceState& state = stateFor(index);
    const int keep = qBound(0, offset, int(state.text.size()));
    state.text = state.text.left(keep);

    // Tokens feed repetition detection and must end where the text does.
    QStringList& tokens = state.completion.tokens;
    int covered = 0;
    int kept = 0;
    while (kept < tokens.size() && covered < keep) {
        const int remaining = keep - covered;
        if (tokens[kept].size() > remaining)
            tokens[kept].truncate(remaining);
        covered += int(tokens[kept].size());
        ++kept;
    }
    tokens.resize(kept);
    state.finished = true;
    state.completion.finishReason = FinishReason::ClientTrimmed;
    m_trimmed = true;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

QString CompletionAccumulator::text(int index) const
{
    return m_states.value(index).text;
}

bool CompletionAccumulator::isFinished(int index) const
{
    return m_states.value(index).finished;
}

bool CompletionAccumulator::allFinished() const
{
    if (m_states.size() < m_expectedChoices)
        return false;
    for (const auto& state : m_states) {
        if (!state.finished)
            return false;
    }
    return true;
}

QList<ChatCompletion> CompletionAccumulator::finalize() const
{
    QList<ChatCompletion> out;
    // QMap iterates in key order, which is the choice index order.
    for (const auto& state : m_states) {
        ChatCompletion completion = state.completion;
        completion.model = m_model;
        completion.usage = m_usage;
        completion.requestId = m_ids;
        completion.requestId.completionId = m_completionId;
        completion.requestId.created = m_created;

        completion.message = ChatMessage{ChatRole::Assistant, {}, {}};
        if (!state.thinking.isEmpty())
            completion.message.content.append(ContentPart::fromThinking(state.thinking));
        if (!state.text.isEmpty())
            completion.message.content.append(ContentPart::fromText(state.text));
        for (const auto& call : state.toolCalls)
            completion.message.content.append(ContentPart::fromToolCall(call));
        out.append(completion);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Payload helpers
// ---------------------------------------------------------------------------

std::optional<FilterCategory> CompletionAccumulator::filteredCategory(const QJsonObject& choice)
{
    const QJsonObject results = choice.value(QStringLiteral("content_filter_results")).toObject();
    for (auto it = results.constBegin(); it != results.constEnd(); ++it) {
        if (it.value().toObject().value(QStringLiteral("filtered")).toBool()) {
            const FilterCategory category = filterCategoryFromWire(it.key());
            if (category != FilterCategory::Unspecified)
                return category;
        }
    }
    // Citation-style blocks arrive without per-category results.
    const QString explicitReason = choice.value(QStringLiteral("content_filter_reason")).toString();
    if (!explicitReason.isEmpty())
        return filterCategoryFromWire(explicitReason);
    return std::nullopt;
}

Usage CompletionAccumulator::parseUsage(const QJsonObject& usage)
{
    Usage u;
    u.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    u.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    u.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();

    const QJsonObject promptDetails = usage.value(QStringLiteral("prompt_tokens_details")).toObject();
    u.cachedPromptTokens = promptDetails.value(QStringLiteral("cached_tokens")).toInt();

    const QJsonObject completionDetails = usage.value(QStringLiteral("completion_tokens_details")).toObject();
    u.reasoningTokens = completionDetails.value(QStringLiteral("reasoning_tokens")).toInt();
    u.acceptedPredictionTokens = completionDetails.value(QStringLiteral("accepted_prediction_tokens")).toInt();
    u.rejectedPredictionTokens = completionDetails.value(QStringLiteral("rejected_prediction_tokens")).toInt();
    return u;
}
