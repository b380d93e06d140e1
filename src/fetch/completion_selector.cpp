#include "completion_selector.h"
#include "repetition.h"

CompletionSelector::CompletionSelector(ITelemetrySink* telemetry)
    : m_telemetry(telemetry)
{
}

bool CompletionSelector::isSuccessfulFinish(FinishReason reason)
{
    switch (reason) {
    case FinishReason::Stop:
    case FinishReason::ClientTrimmed:
    case FinishReason::FunctionCall:
    case FinishReason::ToolCalls:
        return true;
    default:
        return false;
    }
}

bool CompletionSelector::checkRepetition(const ChatCompletion& completion,
                                         const TelemetryProperties& telemetryProperties) const
{
    const bool repetitive = Repetition::isRepetitive(completion.tokens);
    const LineRepetitionStats lines = Repetition::lineRepetitionStats(completion.message.textContent());

    if (m_telemetry && repetitive) {
        TelemetryProperties props = telemetryProperties;
        props[QStringLiteral("headerRequestId")] = completion.requestId.headerRequestId;
        props[QStringLiteral("serverRequestId")] = completion.requestId.serverRequestId;
        props[QStringLiteral("detector")] = QStringLiteral("tokens");
        m_telemetry->sendEvent(QStringLiteral("conversation.repetition.detected"), props, {});
    }

    if (m_telemetry && lines.numberOfRepetitions >= Repetition::kLineRepetitionReportThreshold) {
        TelemetryProperties props;
        props[QStringLiteral("requestId")] = completion.requestId.headerRequestId;
        props[QStringLiteral("finishReason")] = finishReasonName(completion.finishReason);
        props[QStringLiteral("detector")] = QStringLiteral("lines");
        TelemetryMeasurements measurements;
        measurements[QStringLiteral("numberOfRepetitions")] = lines.numberOfRepetitions;
        measurements[QStringLiteral("lengthOfLine")] = lines.mostRepeatedLine.size();
        measurements[QStringLiteral("totalLines")] = lines.totalLines;
        m_telemetry->sendEvent(QStringLiteral("conversation.repetition.detected"), props, measurements);
    }

    return repetitive;
}

SelectionResult CompletionSelector::select(const QList<ChatCompletion>& completions,
                                           const QString& requestId,
                                           const TelemetryProperties& telemetryProperties) const
{
    SelectionResult result;
    result.candidateCount = completions.size();

    QList<ChatCompletion> kept;
    for (const auto& completion : completions) {
        if (checkRepetition(completion, telemetryProperties))
            ++result.repetitiveCount;
        else
            kept.append(completion);
    }

    QList<ChatCompletion> successful;
    for (const auto& completion : kept) {
        if (isSuccessfulFinish(completion.finishReason))
            successful.append(completion);
    }

    ChatResponse& response = result.response;
    response.requestId = requestId;

    if (!successful.isEmpty()) {
        response.type = ChatResponseType::Success;
        response.resolvedModel = successful.first().model;
        if (successful.size() == 1)
            response.usage = successful.first().usage;
        for (const auto& completion : successful)
            response.value.append(completion.message.textContent());
        response.serverRequestId = successful.first().requestId.headerRequestId;
        return result;
    }

    if (kept.isEmpty()) {
        response.type = ChatResponseType::Unknown;
        response.reason = QStringLiteral("Response contained no choices.");
        return result;
    }

    const ChatCompletion& first = kept.first();
    response.serverRequestId = first.requestId.headerRequestId;

    switch (first.finishReason) {
    case FinishReason::ContentFilter:
        response.type = ChatResponseType::FilteredRetry;
        response.category = first.filterReason.value_or(FilterCategory::Copyright);
        response.reason = QStringLiteral("Response got filtered.");
        for (const auto& completion : kept)
            response.value.append(completion.message.textContent());
        break;
    case FinishReason::Length:
        response.type = ChatResponseType::Length;
        response.reason = QStringLiteral("Response too long.");
        response.truncatedValue = first.message.textContent();
        break;
    case FinishReason::ServerError:
        response.type = ChatResponseType::ServerError;
        response.reason = QStringLiteral("Server error. Stream terminated");
        response.streamError = first.error;
        break;
    default:
        response.type = ChatResponseType::Unknown;
        response.reason = QStringLiteral("Response contained no choices.");
        break;
    }
    return result;
}
