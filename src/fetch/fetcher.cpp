#include "fetcher.h"
#include "response_classifier.h"
#include "validate.h"
#include "core/cancellation.h"
#include "core/log_manager.h"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUuid>

namespace {

const QString kLogCategory = QStringLiteral("fetch");
const QString kSessionContinuationHeader = QStringLiteral("copilot-edits-session");

qint64 nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

QString newUuid()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool hasImageParts(const QList<ChatMessage>& messages)
{
    for (const auto& message : messages) {
        if (message.hasImage())
            return true;
    }
    return false;
}

// Checks the built body; non-vision endpoints strip images before this point.
bool bodyHasImageContent(const QJsonObject& body)
{
    const QJsonArray messages = body.value(QStringLiteral("messages")).toArray();
    for (const QJsonValue& message : messages) {
        const QJsonValue content = message.toObject().value(QStringLiteral("content"));
        if (!content.isArray())
            continue;
        for (const QJsonValue& part : content.toArray()) {
            if (part.toObject().contains(QStringLiteral("image_url")))
                return true;
        }
    }
    return false;
}

QString jsonValueText(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double:
        return QString::number(value.toDouble());
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    default:
        return QString();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Outcome helpers
// ---------------------------------------------------------------------------

Fetcher::ExchangeOutcome Fetcher::ExchangeOutcome::success(QList<ChatCompletion> completions)
{
    ExchangeOutcome outcome;
    outcome.kind = Kind::Success;
    outcome.completions = std::move(completions);
    return outcome;
}

Fetcher::ExchangeOutcome Fetcher::ExchangeOutcome::failed(ChatRequestFailed failure)
{
    ExchangeOutcome outcome;
    outcome.kind = Kind::Failed;
    outcome.failure = std::move(failure);
    return outcome;
}

Fetcher::ExchangeOutcome Fetcher::ExchangeOutcome::canceled(const QString& reason)
{
    ExchangeOutcome outcome;
    outcome.kind = Kind::Canceled;
    outcome.cancelReason = reason;
    return outcome;
}

// ---------------------------------------------------------------------------
// Construction and configuration
// ---------------------------------------------------------------------------

Fetcher::Fetcher(QObject* parent)
    : QObject(parent)
    , m_hardToolLimit(Validate::kDefaultHardToolLimit)
    , m_interactionId(newUuid())
{
}

void Fetcher::setConversationDefaults(std::optional<double> temperature, std::optional<double> topP)
{
    m_defaultTemperature = temperature;
    m_defaultTopP = topP;
}

RequestOptions Fetcher::preparePostOptions(const RequestOptions& requestOptions, int maxResponseTokens) const
{
    RequestOptions post = requestOptions;
    if (!post.prediction.has_value() && !post.maxTokens.has_value())
        post.maxTokens = maxResponseTokens;
    // An empty prediction is rejected by the server with a 400.
    if (post.prediction.has_value() && post.prediction->content.isEmpty())
        post.prediction.reset();
    if (!post.temperature.has_value())
        post.temperature = m_defaultTemperature;
    if (!post.topP.has_value())
        post.topP = m_defaultTopP;
    // Non-streamed responses are not supported.
    post.stream = true;
    return post;
}

ITransport* Fetcher::transportFor(TransportHint hint) const
{
    if (hint == TransportHint::Alternate && m_alternateTransport)
        return m_alternateTransport;
    return m_transport;
}

// ---------------------------------------------------------------------------
// Public entry points
// ---------------------------------------------------------------------------

ChatResponse Fetcher::fetchOne(FetchOptions options, const CancellationToken& token)
{
    options.requestOptions.n = 1;
    ChatResponse response = fetchMany(std::move(options), token);
    if (response.type == ChatResponseType::Success && response.value.size() > 1)
        response.value = QStringList{response.value.first()};
    return response;
}

ChatResponse Fetcher::fetchMany(FetchOptions options, const CancellationToken& token)
{
    CallContext ctx;
    ctx.options = &options;
    ctx.telemetryProperties = options.telemetryProperties;
    if (ctx.telemetryProperties.value(QStringLiteral("messageSource")).isEmpty())
        ctx.telemetryProperties[QStringLiteral("messageSource")] = options.debugName;

    ctx.requestId = ctx.telemetryProperties.value(QStringLiteral("requestId"));
    if (ctx.requestId.isEmpty())
        ctx.requestId = ctx.telemetryProperties.value(QStringLiteral("messageId"));
    if (ctx.requestId.isEmpty())
        ctx.requestId = newUuid();

    IChatEndpoint* endpoint = options.endpoint;
    if (!endpoint) {
        LOG_CAT_ERROR(kLogCategory, QStringLiteral("fetchMany called without an endpoint"));
        ChatResponse failed;
        failed.type = ChatResponseType::Failed;
        failed.reason = QStringLiteral("No chat endpoint configured.");
        failed.requestId = ctx.requestId;
        return failed;
    }

    ctx.maxResponseTokens = endpoint->maxOutputTokens();
    ctx.postOptions = preparePostOptions(options.requestOptions, ctx.maxResponseTokens);
    ctx.isVisionRequest = hasImageParts(options.messages);

    EndpointRequest endpointRequest;
    endpointRequest.messages = options.messages;
    endpointRequest.postOptions = ctx.postOptions;
    endpointRequest.requestId = ctx.requestId;
    endpointRequest.location = options.location;
    endpointRequest.ignoreStatefulMarker = options.ignoreStatefulMarker;
    ctx.body = endpoint->createRequestBody(endpointRequest);
    ctx.issuedTime = nowMs();

    std::unique_ptr<IPendingRequest> pending;
    if (m_requestLogger) {
        LoggedRequest logged;
        logged.debugName = options.debugName;
        logged.model = endpoint->model();
        logged.requestId = ctx.requestId;
        logged.location = options.location;
        logged.messages = options.messages;
        logged.body = ctx.body;
        logged.ignoreStatefulMarker = options.ignoreStatefulMarker;
        pending = m_requestLogger->begin(logged);
    }

    StreamRecorder recorder(options.finishedCb);
    RetryCoordinator retries([this](const FetchOptions& retryOptions, const CancellationToken& retryToken) {
        return fetchMany(retryOptions, retryToken);
    });

    TransportResult<ExchangeOutcome> exchange = ExchangeOutcome{};
    ValidationResult valid = Validate::chatPayload(options.messages, ctx.postOptions, m_hardToolLimit);
    if (!valid.has_value()) {
        exchange = ExchangeOutcome::failed(valid.error());
    } else {
        exchange = fetchAndStreamChat(ctx, recorder, token);
        ctx.tokenCount = endpoint->tokenizer().countMessagesTokens(options.messages);
        emit chatRequestMade(MadeRequestEvent{options.messages, endpoint->model(),
                                              options.sourceId, ctx.tokenCount});
    }

    const qint64 timeToFirstToken = nowMs() - ctx.issuedTime;

    // Transport-level failure: network abort, stream reset, generic I/O.
    if (!exchange.has_value()) {
        const TransportError& error = exchange.error();
        ChatResponse processed = processError(error, ctx.requestId, options.transport, token);

        const RetryDecision decision = retries.shouldRetryNetworkChange(options, processed, error);
        if (decision.retry) {
            sendResponseErrorTelemetry(ctx, processed, timeToFirstToken);
            ChatResponse retryResult = retries.retryAfterNetworkChange(options, recorder.callback(), token);
            if (pending)
                pending->resolve(retryResult, recorder.deltas());
            return retryResult;
        }

        if (processed.type == ChatResponseType::Canceled) {
            sendCancellationTelemetry(ctx, std::nullopt, nullptr);
            if (pending)
                pending->resolveCancelled();
        } else {
            sendResponseErrorTelemetry(ctx, processed, timeToFirstToken);
            if (pending)
                pending->resolve(processed, recorder.deltas());
        }
        return processed;
    }

    if (pending)
        pending->markTimeToFirstToken(timeToFirstToken);

    const ExchangeOutcome& outcome = exchange.value();
    switch (outcome.kind) {
    case ExchangeOutcome::Kind::Success: {
        ChatResponse result = processSuccessfulResponse(ctx, outcome.completions, timeToFirstToken, recorder);

        if (result.type == ChatResponseType::FilteredRetry) {
            const RetryDecision decision = retries.shouldRetryFilter(options, result);
            ChatResponse terminal = decision.retry
                ? retries.retryAfterFilter(options, result, recorder.callback(), token)
                : RetryCoordinator::toTerminalFiltered(result);
            if (pending)
                pending->resolve(terminal, recorder.deltas());
            return terminal;
        }

        if (pending)
            pending->resolve(result, recorder.deltas());
        return result;
    }

    case ExchangeOutcome::Kind::Canceled:
        sendCancellationTelemetry(ctx, timeToFirstToken, &recorder);
        if (pending)
            pending->resolveCancelled();
        return processCanceledResponse(outcome.cancelReason, ctx.requestId);

    case ExchangeOutcome::Kind::Failed: {
        ChatResponse processed = processFailedResponse(outcome.failure, ctx.requestId);
        sendResponseErrorTelemetry(ctx, processed, timeToFirstToken);
        if (pending)
            pending->resolve(processed, recorder.deltas());
        return processed;
    }
    }

    return processFailedResponse(outcome.failure, ctx.requestId);
}

// ---------------------------------------------------------------------------
// Network exchange
// ---------------------------------------------------------------------------

TransportResult<Fetcher::ExchangeOutcome> Fetcher::fetchAndStreamChat(const CallContext& ctx,
                                                                      StreamRecorder& recorder,
                                                                      const CancellationToken& token)
{
    if (token.isCancellationRequested())
        return ExchangeOutcome::canceled(QStringLiteral("before fetch request"));

    const FetchOptions& options = *ctx.options;
    IChatEndpoint* endpoint = options.endpoint;

    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("modelMaxPromptTokens %1").arg(endpoint->modelMaxPromptTokens()));
    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("modelMaxResponseTokens %1")
                                    .arg(ctx.postOptions.maxTokens.value_or(2048)));
    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("chat model %1").arg(endpoint->model()));

    QString secretKey = ctx.postOptions.secretKey.value_or(QString());
    if (secretKey.isEmpty() && m_auth)
        secretKey = m_auth->currentToken();
    if (secretKey.isEmpty()) {
        const QString message = QStringLiteral("Failed to send request to %1 due to missing key")
                                    .arg(endpoint->url());
        LOG_CAT_ERROR(kLogCategory, message);
        if (m_telemetry)
            m_telemetry->sendException(QStringLiteral("communication"), message);
        return ExchangeOutcome::failed(ChatRequestFailed::missingKey());
    }

    // Links the request and response telemetry of this one exchange.
    const QString modelCallId = newUuid();

    auto sent = fetchWithInstrumentation(ctx, secretKey, modelCallId, token);
    if (!sent.has_value())
        return std::unexpected(sent.error());
    std::unique_ptr<IRawResponse> response = std::move(sent.value());

    if (token.isCancellationRequested()) {
        // Tear the stream down so the server stops generating for us.
        response->destroy();
        return ExchangeOutcome::canceled(QStringLiteral("after fetch request"));
    }

    const int status = response->status();
    if (status < 200 || status >= 300) {
        LOG_CAT_INFO(kLogCategory, QStringLiteral("Request ID for failed request: %1").arg(ctx.requestId));
        return handleError(ctx, *response, token);
    }

    auto completions = endpoint->processResponse(*response,
                                                 ctx.postOptions.n.value_or(1),
                                                 recorder.callback(),
                                                 token);
    if (token.isCancellationRequested()) {
        response->destroy();
        return ExchangeOutcome::canceled(QStringLiteral("during streaming"));
    }
    if (!completions.has_value()) {
        response->destroy();
        return std::unexpected(completions.error());
    }

    const QString sessionToken = response->header(kSessionContinuationHeader);
    if (!sessionToken.isEmpty() && m_auth)
        m_auth->setSessionContinuationToken(sessionToken);

    if (m_quota)
        m_quota->processQuotaHeaders(response->headers());

    return ExchangeOutcome::success(completions.value());
}

TransportResult<std::unique_ptr<IRawResponse>> Fetcher::fetchWithInstrumentation(
    const CallContext& ctx,
    const QString& secretKey,
    const QString& modelCallId,
    const CancellationToken& token)
{
    const FetchOptions& options = *ctx.options;
    IChatEndpoint* endpoint = options.endpoint;

    TransportRequest request;
    request.url = endpoint->url();
    request.requestId = ctx.requestId;
    request.body = QJsonDocument(ctx.body).toJson(QJsonDocument::Compact);
    request.headers[QStringLiteral("authorization")] = QStringLiteral("Bearer ") + secretKey;
    request.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
    request.headers[QStringLiteral("x-request-id")] = ctx.requestId;
    request.headers[QStringLiteral("x-interaction-id")] = m_interactionId;
    request.headers[QStringLiteral("x-initiator")] =
        options.userInitiatedRequest ? QStringLiteral("user") : QStringLiteral("agent");
    request.headers[QStringLiteral("openai-intent")] = locationToIntent(options.location);
    if (endpoint->supportsVision() && bodyHasImageContent(ctx.body))
        request.headers[QStringLiteral("x-vision-request")] = QStringLiteral("true");

    TelemetryProperties props = ctx.telemetryProperties;
    props[QStringLiteral("endpoint")] = QStringLiteral("completions");
    props[QStringLiteral("engineName")] = QStringLiteral("chat");
    props[QStringLiteral("uiKind")] = chatLocationName(options.location);
    props[QStringLiteral("modelCallId")] = modelCallId;
    for (auto it = ctx.body.constBegin(); it != ctx.body.constEnd(); ++it) {
        // Message content is never sent to telemetry.
        if (it.key() == QStringLiteral("messages") || it.key() == QStringLiteral("input"))
            continue;
        props[QStringLiteral("request.option.") + it.key()] = jsonValueText(it.value());
    }
    props[QStringLiteral("headerRequestId")] = ctx.requestId;

    TelemetryMeasurements measurements;
    measurements[QStringLiteral("maxTokenWindow")] = endpoint->modelMaxPromptTokens();
    sendTelemetry(QStringLiteral("request.sent"), props, measurements);

    ITransport* transport = transportFor(options.transport);
    if (!transport) {
        LOG_CAT_ERROR(kLogCategory, QStringLiteral("No transport configured"));
        return std::unexpected(TransportError::generic(QStringLiteral("no transport configured")));
    }

    const qint64 requestStart = nowMs();
    auto sent = transport->send(request, token);
    measurements[QStringLiteral("totalTimeMs")] = nowMs() - requestStart;

    if (!sent.has_value()) {
        const TransportError& error = sent.error();
        // A cancelled request is not a request error.
        if (transport->isAbortError(error))
            return std::unexpected(error);

        TelemetryProperties warning = props;
        warning[QStringLiteral("error")] = QStringLiteral("Network exception");
        sendTelemetry(QStringLiteral("request.shownWarning"), warning, measurements);

        props[QStringLiteral("code")] = QString::number(error.code);
        props[QStringLiteral("message")] = error.message;
        props[QStringLiteral("type")] = transportErrorKindName(error.kind);
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("request.response: [%1] took %2 ms")
                                        .arg(request.url)
                                        .arg(measurements.value(QStringLiteral("totalTimeMs"))));
        sendTelemetry(QStringLiteral("request.error"), props, measurements);
        return std::unexpected(error);
    }

    const IRawResponse& response = *sent.value();
    const QString apim = response.header(QStringLiteral("apim-request-id"));
    if (!apim.isEmpty())
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("APIM request id: %1").arg(apim));
    const ModelRequestId ids = ResponseClassifier::requestIdFromHeaders(response.headers());
    if (!ids.serverRequestId.isEmpty())
        LOG_CAT_DEBUG(kLogCategory, QStringLiteral("Server request id: %1").arg(ids.serverRequestId));
    // The server usually echoes our id; when it does not, its id wins.
    if (!ids.headerRequestId.isEmpty())
        props[QStringLiteral("headerRequestId")] = ids.headerRequestId;
    props[QStringLiteral("serverRequestId")] = ids.serverRequestId;

    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("request.response: [%1], took %2 ms")
                                    .arg(request.url)
                                    .arg(measurements.value(QStringLiteral("totalTimeMs"))));
    sendTelemetry(QStringLiteral("request.response"), props, measurements);
    return std::move(sent.value());
}

TransportResult<Fetcher::ExchangeOutcome> Fetcher::handleError(const CallContext& ctx,
                                                               IRawResponse& response,
                                                               const CancellationToken& token)
{
    const int status = response.status();
    // A request id echoed or assigned by the server replaces ours from here on.
    const ModelRequestId ids = ResponseClassifier::requestIdFromHeaders(response.headers());
    const QString requestId = ids.headerRequestId.isEmpty() ? ctx.requestId : ids.headerRequestId;

    TelemetryProperties props;
    props[QStringLiteral("endpoint")] = QStringLiteral("completions");
    props[QStringLiteral("engineName")] = QStringLiteral("chat");
    props[QStringLiteral("uiKind")] = chatLocationName(ctx.options->location);
    props[QStringLiteral("headerRequestId")] = requestId;
    props[QStringLiteral("error")] = QStringLiteral("Response status was %1").arg(status);
    props[QStringLiteral("status")] = QString::number(status);
    sendTelemetry(QStringLiteral("request.shownWarning"), props);

    auto body = response.text(token);
    if (!body.has_value())
        return std::unexpected(body.error());

    ChatRequestFailed failure = ResponseClassifier::classify(
        status, body.value(), response.headers(), QDateTime::currentDateTimeUtc());
    failure.modelRequestId.headerRequestId = requestId;

    // The next call must fetch a fresh credential; this one is not retried.
    if (failure.invalidatesCredential() && m_auth)
        m_auth->invalidateToken(status);

    switch (failure.failKind) {
    case FailKind::ClientNotSupported:
        LOG_CAT_INFO(kLogCategory, QString::fromUtf8(body.value()));
        break;
    case FailKind::ServerCanceled:
        LOG_CAT_INFO(kLogCategory, QStringLiteral("Cancelled by server"));
        break;
    case FailKind::ServerError:
        LOG_CAT_ERROR(kLogCategory, failure.reason + QLatin1Char(' ') + QString::fromUtf8(body.value()));
        break;
    case FailKind::Unknown:
        LOG_CAT_ERROR(kLogCategory, failure.reason);
        if (m_telemetry)
            m_telemetry->sendException(QStringLiteral("communication"),
                                       QStringLiteral("Unhandled status from server: %1").arg(status));
        break;
    default:
        break;
    }

    return ExchangeOutcome::failed(failure);
}

// ---------------------------------------------------------------------------
// Outcome processing
// ---------------------------------------------------------------------------

ChatResponse Fetcher::processSuccessfulResponse(const CallContext& ctx,
                                                const QList<ChatCompletion>& completions,
                                                qint64 timeToFirstToken,
                                                const StreamRecorder& recorder)
{
    const FetchOptions& options = *ctx.options;
    IChatEndpoint* endpoint = options.endpoint;

    CompletionSelector selector(m_telemetry);
    const SelectionResult selection = selector.select(completions, ctx.requestId, ctx.telemetryProperties);

    TelemetryProperties props = retryCategories(ctx.telemetryProperties);
    props[QStringLiteral("source")] =
        ctx.telemetryProperties.value(QStringLiteral("messageSource"), QStringLiteral("unknown"));
    props[QStringLiteral("initiatorType")] =
        options.userInitiatedRequest ? QStringLiteral("user") : QStringLiteral("agent");
    props[QStringLiteral("model")] = endpoint->model();
    props[QStringLiteral("apiType")] = endpoint->apiType();
    props[QStringLiteral("requestId")] = ctx.requestId;
    props[QStringLiteral("associatedRequestId")] =
        ctx.telemetryProperties.value(QStringLiteral("associatedRequestId"));
    props[QStringLiteral("resultType")] = chatResponseTypeName(selection.response.type);

    TelemetryMeasurements measurements;
    if (!completions.isEmpty()) {
        const ChatCompletion& first = completions.first();
        props[QStringLiteral("reason")] = finishReasonName(first.finishReason);
        if (first.filterReason.has_value())
            props[QStringLiteral("filterReason")] = filterCategoryName(*first.filterReason);
        props[QStringLiteral("modelInvoked")] = first.model;
        if (first.usage.has_value()) {
            measurements[QStringLiteral("promptTokenCount")] = first.usage->promptTokens;
            measurements[QStringLiteral("promptCacheTokenCount")] = first.usage->cachedPromptTokens;
            measurements[QStringLiteral("tokenCount")] = first.usage->totalTokens;
            measurements[QStringLiteral("completionTokens")] = first.usage->completionTokens;
            measurements[QStringLiteral("reasoningTokens")] = first.usage->reasoningTokens;
            measurements[QStringLiteral("acceptedPredictionTokens")] = first.usage->acceptedPredictionTokens;
            measurements[QStringLiteral("rejectedPredictionTokens")] = first.usage->rejectedPredictionTokens;
        }
    }
    measurements[QStringLiteral("totalTokenMax")] = endpoint->modelMaxPromptTokens();
    measurements[QStringLiteral("tokenCountMax")] = ctx.maxResponseTokens;
    measurements[QStringLiteral("clientPromptTokenCount")] = ctx.tokenCount;
    measurements[QStringLiteral("timeToFirstToken")] = timeToFirstToken;
    measurements[QStringLiteral("timeToFirstTokenEmitted")] = recorder.firstTokenEmittedTime().has_value()
        ? double(*recorder.firstTokenEmittedTime() - ctx.issuedTime)
        : -1.0;
    measurements[QStringLiteral("timeToComplete")] = nowMs() - ctx.issuedTime;
    measurements[QStringLiteral("isVisionRequest")] = ctx.isVisionRequest ? 1 : -1;
    measurements[QStringLiteral("candidateCount")] = selection.candidateCount;
    measurements[QStringLiteral("repetitiveCount")] = selection.repetitiveCount;
    sendTelemetry(QStringLiteral("response.success"), props, measurements);

    return selection.response;
}

ChatResponse Fetcher::processFailedResponse(const ChatRequestFailed& failure, const QString& requestId) const
{
    ChatResponse out;
    out.reason = failure.reason;
    out.requestId = requestId;
    out.serverRequestId = failure.modelRequestId.serverRequestId;

    switch (failure.failKind) {
    case FailKind::RateLimited:
        out.type = ChatResponseType::RateLimited;
        out.retryAfter = failure.retryAfter;
        out.retryAfterSeconds = failure.retryAfterSeconds;
        out.rateLimitKey = failure.rateLimitKey;
        out.capiError = failure.errorData;
        return out;
    case FailKind::QuotaExceeded:
        out.type = ChatResponseType::QuotaExceeded;
        out.retryAfter = failure.retryAfter;
        out.retryAfterSeconds = failure.retryAfterSeconds;
        out.capiError = failure.errorData;
        return out;
    case FailKind::OffTopic:
        out.type = ChatResponseType::OffTopic;
        return out;
    case FailKind::TokenExpiredOrInvalid:
        out.type = ChatResponseType::TokenExpiredOrInvalid;
        return out;
    case FailKind::ClientNotSupported:
    case FailKind::ValidationFailed:
        out.type = ChatResponseType::BadRequest;
        return out;
    case FailKind::ServerError:
        out.type = ChatResponseType::ServerError;
        return out;
    case FailKind::ContentFilter:
        out.type = ChatResponseType::PromptFiltered;
        out.category = FilterCategory::Prompt;
        return out;
    case FailKind::AgentUnauthorized:
        out.type = ChatResponseType::AgentUnauthorized;
        out.authorizationUrl = failure.authorizeUrl;
        return out;
    case FailKind::AgentFailedDependency:
        out.type = ChatResponseType::AgentFailedDependency;
        return out;
    case FailKind::ExtensionBlocked:
        out.type = ChatResponseType::ExtensionBlocked;
        out.retryAfter = failure.retryAfter;
        out.retryAfterSeconds = failure.retryAfterSeconds;
        out.capiError = failure.errorData;
        return out;
    case FailKind::NotFound:
        out.type = ChatResponseType::NotFound;
        return out;
    case FailKind::InvalidStatefulMarker:
        out.type = ChatResponseType::InvalidStatefulMarker;
        return out;
    case FailKind::ServerCanceled:
        out.type = ChatResponseType::Failed;
        return out;
    case FailKind::Unknown:
        out.type = failure.reason.contains(QStringLiteral("Bad request: "))
            ? ChatResponseType::BadRequest
            : ChatResponseType::Unknown;
        return out;
    }

    out.type = ChatResponseType::Unknown;
    return out;
}

ChatResponse Fetcher::processCanceledResponse(const QString& reason, const QString& requestId) const
{
    ChatResponse out;
    out.type = ChatResponseType::Canceled;
    out.reason = reason;
    out.requestId = requestId;
    return out;
}

ChatResponse Fetcher::processError(const TransportError& error,
                                   const QString& requestId,
                                   TransportHint hint,
                                   const CancellationToken& token)
{
    ITransport* transport = transportFor(hint);

    ChatResponse out;
    out.requestId = requestId;

    if (transport && transport->isAbortError(error)) {
        out.type = ChatResponseType::Canceled;
        out.reason = QStringLiteral("network request aborted");
        return out;
    }
    if (token.isCancellationRequested()) {
        out.type = ChatResponseType::Canceled;
        out.reason = QStringLiteral("Got a cancellation error");
        return out;
    }
    if (error.kind == TransportErrorKind::PrematureClose) {
        out.type = ChatResponseType::Canceled;
        out.reason = QStringLiteral("Stream closed prematurely");
        return out;
    }

    LOG_CAT_ERROR(kLogCategory, QStringLiteral("Error on conversation request: [%1] %2")
                                    .arg(transportErrorKindName(error.kind), error.message));
    if (m_telemetry)
        m_telemetry->sendException(QStringLiteral("Error on conversation request"), error.message);

    const QString detail = transport ? transport->userMessageForError(error) : error.message;
    out.reasonDetail = detail;

    if (transport && transport->isInternetDisconnectedError(error)) {
        out.type = ChatResponseType::NetworkError;
        out.reason = QStringLiteral("It appears you're not connected to the internet, please check "
                                    "your network connection and try again.");
    } else if (transport && transport->isFetcherError(error)) {
        out.type = ChatResponseType::NetworkError;
        out.reason = detail;
    } else {
        out.type = ChatResponseType::Failed;
        out.reason = QStringLiteral("Error on conversation request. Check the log for more details.");
    }
    return out;
}

// ---------------------------------------------------------------------------
// Telemetry
// ---------------------------------------------------------------------------

void Fetcher::sendTelemetry(const QString& name,
                            const TelemetryProperties& properties,
                            const TelemetryMeasurements& measurements) const
{
    if (m_telemetry)
        m_telemetry->sendEvent(name, properties, measurements);
}

TelemetryProperties Fetcher::retryCategories(const TelemetryProperties& source) const
{
    TelemetryProperties props;
    for (const char* key : {"retryAfterErrorCategory", "retryAfterFilterCategory"}) {
        const QString k = QString::fromLatin1(key);
        if (!source.value(k).isEmpty())
            props[k] = source.value(k);
    }
    return props;
}

void Fetcher::sendCancellationTelemetry(const CallContext& ctx,
                                        std::optional<qint64> timeToFirstToken,
                                        const StreamRecorder* recorder) const
{
    IChatEndpoint* endpoint = ctx.options->endpoint;

    TelemetryProperties props = retryCategories(ctx.telemetryProperties);
    props[QStringLiteral("source")] =
        ctx.telemetryProperties.value(QStringLiteral("messageSource"), QStringLiteral("unknown"));
    props[QStringLiteral("requestId")] = ctx.requestId;
    props[QStringLiteral("model")] = endpoint->model();
    props[QStringLiteral("apiType")] = endpoint->apiType();
    props[QStringLiteral("associatedRequestId")] =
        ctx.telemetryProperties.value(QStringLiteral("associatedRequestId"));

    TelemetryMeasurements measurements;
    measurements[QStringLiteral("totalTokenMax")] = endpoint->modelMaxPromptTokens();
    measurements[QStringLiteral("promptTokenCount")] = ctx.tokenCount;
    measurements[QStringLiteral("tokenCountMax")] = ctx.maxResponseTokens;
    if (timeToFirstToken.has_value())
        measurements[QStringLiteral("timeToFirstToken")] = *timeToFirstToken;
    measurements[QStringLiteral("timeToFirstTokenEmitted")] =
        (recorder && recorder->firstTokenEmittedTime().has_value())
            ? double(*recorder->firstTokenEmittedTime() - ctx.issuedTime)
            : -1.0;
    measurements[QStringLiteral("timeToCancelled")] = nowMs() - ctx.issuedTime;
    measurements[QStringLiteral("isVisionRequest")] = ctx.isVisionRequest ? 1 : -1;
    sendTelemetry(QStringLiteral("response.cancelled"), props, measurements);
}

void Fetcher::sendResponseErrorTelemetry(const CallContext& ctx,
                                         const ChatResponse& processed,
                                         qint64 timeToFirstToken) const
{
    IChatEndpoint* endpoint = ctx.options->endpoint;

    TelemetryProperties props = retryCategories(ctx.telemetryProperties);
    props[QStringLiteral("type")] = chatResponseTypeName(processed.type);
    props[QStringLiteral("reason")] =
        processed.reasonDetail.isEmpty() ? processed.reason : processed.reasonDetail;
    props[QStringLiteral("source")] =
        ctx.telemetryProperties.value(QStringLiteral("messageSource"), QStringLiteral("unknown"));
    props[QStringLiteral("requestId")] = ctx.requestId;
    props[QStringLiteral("model")] = endpoint->model();
    props[QStringLiteral("apiType")] = endpoint->apiType();
    props[QStringLiteral("associatedRequestId")] =
        ctx.telemetryProperties.value(QStringLiteral("associatedRequestId"));

    TelemetryMeasurements measurements;
    measurements[QStringLiteral("totalTokenMax")] = endpoint->modelMaxPromptTokens();
    measurements[QStringLiteral("promptTokenCount")] = ctx.tokenCount;
    measurements[QStringLiteral("tokenCountMax")] = ctx.maxResponseTokens;
    measurements[QStringLiteral("timeToFirstToken")] = timeToFirstToken;
    measurements[QStringLiteral("isVisionRequest")] = ctx.isVisionRequest ? 1 : -1;
    sendTelemetry(QStringLiteral("response.error"), props, measurements);
}
