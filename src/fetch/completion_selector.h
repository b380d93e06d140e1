#pragma once
#include "chat/completion.h"
#include "chat/ports.h"
#include "chat/response.h"
#include <QList>

struct SelectionResult {
    ChatResponse response;
    int candidateCount = 0;
    int repetitiveCount = 0;
};

// Turns the candidates of one streamed exchange into a single ChatResponse.
// Repetitive candidates never count as successful; they are reported to
// telemetry and otherwise ignored.
class CompletionSelector {
public:
    explicit CompletionSelector(ITelemetrySink* telemetry = nullptr);

    SelectionResult select(const QList<ChatCompletion>& completions,
                           const QString& requestId,
                           const TelemetryProperties& telemetryProperties = {}) const;

    static bool isSuccessfulFinish(FinishReason reason);

private:
    ITelemetrySink* m_telemetry = nullptr;

    bool checkRepetition(const ChatCompletion& completion,
                         const TelemetryProperties& telemetryProperties) const;
};
