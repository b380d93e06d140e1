#pragma once
#include "fetch_options.h"
#include "completion_selector.h"
#include "retry_coordinator.h"
#include "stream_recorder.h"
#include "chat/ports.h"
#include <QObject>
#include <memory>

class CancellationToken;

// Entry point of the engine. Turns one logical completion request into a
// streamed exchange, classifies the outcome and performs at most one
// filter retry and one network-change retry per top-level call.
//
// Collaborators are borrowed, never owned. Calls block the calling thread
// while network I/O is pending; concurrent calls need one Fetcher per thread.
class Fetcher : public QObject {
    Q_OBJECT
public:
    explicit Fetcher(QObject* parent = nullptr);

    void setTransport(ITransport* transport) { m_transport = transport; }
    void setAlternateTransport(ITransport* transport) { m_alternateTransport = transport; }
    void setAuth(IAuthService* auth) { m_auth = auth; }
    void setTelemetry(ITelemetrySink* telemetry) { m_telemetry = telemetry; }
    void setRequestLogger(IRequestLogger* logger) { m_requestLogger = logger; }
    void setQuotaService(IQuotaService* quota) { m_quota = quota; }

    void setHardToolLimit(int limit) { m_hardToolLimit = limit; }
    void setConversationDefaults(std::optional<double> temperature, std::optional<double> topP);
    void setInteractionId(const QString& id) { m_interactionId = id; }
    QString interactionId() const { return m_interactionId; }

    ChatResponse fetchOne(FetchOptions options, const CancellationToken& token);
    // The returned value list may hold fewer than n entries when candidates
    // were dropped while streaming.
    ChatResponse fetchMany(FetchOptions options, const CancellationToken& token);

signals:
    void chatRequestMade(const MadeRequestEvent& event);

private:
    struct ExchangeOutcome {
        enum class Kind { Success, Failed, Canceled };
        Kind kind = Kind::Failed;
        QList<ChatCompletion> completions;
        ChatRequestFailed failure;
        QString cancelReason;

        static ExchangeOutcome success(QList<ChatCompletion> completions);
        static ExchangeOutcome failed(ChatRequestFailed failure);
        static ExchangeOutcome canceled(const QString& reason);
    };

    struct CallContext {
        const FetchOptions* options = nullptr;
        QString requestId;
        TelemetryProperties telemetryProperties;
        RequestOptions postOptions;
        QJsonObject body;
        qint64 issuedTime = 0;
        int maxResponseTokens = 0;
        int tokenCount = -1;
        bool isVisionRequest = false;
    };

    ITransport*      m_transport = nullptr;
    ITransport*      m_alternateTransport = nullptr;
    IAuthService*    m_auth = nullptr;
    ITelemetrySink*  m_telemetry = nullptr;
    IRequestLogger*  m_requestLogger = nullptr;
    IQuotaService*   m_quota = nullptr;

    int m_hardToolLimit;
    std::optional<double> m_defaultTemperature;
    std::optional<double> m_defaultTopP;
    QString m_interactionId;

    RequestOptions preparePostOptions(const RequestOptions& requestOptions, int maxResponseTokens) const;
    ITransport* transportFor(TransportHint hint) const;

    TransportResult<ExchangeOutcome> fetchAndStreamChat(const CallContext& ctx,
                                                        StreamRecorder& recorder,
                                                        const CancellationToken& token);
    TransportResult<std::unique_ptr<IRawResponse>> fetchWithInstrumentation(
        const CallContext& ctx,
        const QString& secretKey,
        const QString& modelCallId,
        const CancellationToken& token);
    TransportResult<ExchangeOutcome> handleError(const CallContext& ctx,
                                                 IRawResponse& response,
                                                 const CancellationToken& token);

    ChatResponse processSuccessfulResponse(const CallContext& ctx,
                                           const QList<ChatCompletion>& completions,
                                           qint64 timeToFirstToken,
                                           const StreamRecorder& recorder);
    ChatResponse processFailedResponse(const ChatRequestFailed& failure, const QString& requestId) const;
    ChatResponse processCanceledResponse(const QString& reason, const QString& requestId) const;
    ChatResponse processError(const TransportError& error,
                              const QString& requestId,
                              TransportHint hint,
                              const CancellationToken& token);

    void sendTelemetry(const QString& name,
                       const TelemetryProperties& properties,
                       const TelemetryMeasurements& measurements = {}) const;
    void sendCancellationTelemetry(const CallContext& ctx,
                                   std::optional<qint64> timeToFirstToken,
                                   const StreamRecorder* recorder) const;
    void sendResponseErrorTelemetry(const CallContext& ctx,
                                    const ChatResponse& processed,
                                    qint64 timeToFirstToken) const;
    TelemetryProperties retryCategories(const TelemetryProperties& source) const;
};
