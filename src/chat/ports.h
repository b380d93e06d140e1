#pragma once
#include "completion.h"
#include "failure.h"
#include "message.h"
#include "request.h"
#include "response.h"
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <expected>
#include <memory>
#include <optional>

class CancellationToken;

template<typename T>
using TransportResult = std::expected<T, TransportError>;

template<typename T>
using FetchResult = std::expected<T, ChatRequestFailed>;

using ValidationResult = std::expected<void, ChatRequestFailed>;

// Header names are stored lower-cased.
using HttpHeaders = QMap<QString, QString>;

using TelemetryMeasurements = QMap<QString, double>;

struct TransportRequest {
    QString method = QStringLiteral("POST");
    QString url;
    HttpHeaders headers;
    QByteArray body;
    QString requestId;
};

class IRawResponse {
public:
    virtual ~IRawResponse() = default;
    virtual int status() const = 0;
    virtual QString statusText() const = 0;
    virtual HttpHeaders headers() const = 0;
    QString header(const QString& name) const { return headers().value(name.toLower()); }

    // Next body chunk in arrival order, std::nullopt once the body is complete.
    virtual TransportResult<std::optional<QByteArray>> read(const CancellationToken& token) = 0;
    // Remaining body as one buffer.
    virtual TransportResult<QByteArray> text(const CancellationToken& token) = 0;
    // Tears down the in-flight stream so the server stops producing tokens.
    virtual void destroy() = 0;
};

class ITransport {
public:
    virtual ~ITransport() = default;
    virtual QString transportId() const = 0;
    virtual TransportResult<std::unique_ptr<IRawResponse>> send(
        const TransportRequest& request, const CancellationToken& token) = 0;

    virtual bool isAbortError(const TransportError& error) const {
        return error.kind == TransportErrorKind::Aborted;
    }
    virtual bool isInternetDisconnectedError(const TransportError& error) const {
        return error.kind == TransportErrorKind::InternetDisconnected;
    }
    virtual bool isNetworkChangedError(const TransportError& error) const {
        return error.kind == TransportErrorKind::NetworkChanged;
    }
    virtual bool isFetcherError(const TransportError& error) const {
        return error.kind == TransportErrorKind::Fetcher
            || error.kind == TransportErrorKind::NetworkChanged
            || error.kind == TransportErrorKind::InternetDisconnected;
    }
    virtual QString userMessageForError(const TransportError& error) const {
        return error.message;
    }
};

class ITokenizer {
public:
    virtual ~ITokenizer() = default;
    virtual int countMessagesTokens(const QList<ChatMessage>& messages) const = 0;
};

struct EndpointRequest {
    QList<ChatMessage> messages;
    RequestOptions postOptions;
    QString requestId;
    ChatLocation location = ChatLocation::Panel;
    bool ignoreStatefulMarker = false;
};

class IChatEndpoint {
public:
    virtual ~IChatEndpoint() = default;
    virtual QString model() const = 0;
    virtual QString apiType() const = 0;
    virtual QString url() const = 0;
    virtual int maxOutputTokens() const = 0;
    virtual int modelMaxPromptTokens() const = 0;
    virtual bool supportsVision() const = 0;
    virtual const ITokenizer& tokenizer() const = 0;

    virtual QJsonObject createRequestBody(const EndpointRequest& request) const = 0;
    virtual TransportResult<QList<ChatCompletion>> processResponse(
        IRawResponse& response,
        int expectedChoices,
        const FinishedCallback& finishedCb,
        const CancellationToken& token) = 0;
};

class IAuthService {
public:
    virtual ~IAuthService() = default;
    // Empty when no credential is available.
    virtual QString currentToken() = 0;
    virtual void invalidateToken(int httpStatus) = 0;
    virtual void setSessionContinuationToken(const QString& token) { Q_UNUSED(token); }
};

class IQuotaService {
public:
    virtual ~IQuotaService() = default;
    virtual void processQuotaHeaders(const HttpHeaders& headers) = 0;
};

// Implementations must return quickly and never throw.
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;
    virtual void sendEvent(const QString& name,
                           const TelemetryProperties& properties,
                           const TelemetryMeasurements& measurements) noexcept = 0;
    virtual void sendException(const QString& origin, const QString& message) noexcept = 0;
};

struct RecordedDelta {
    int index = 0;
    QString text;
    ResponseDelta delta;
};

struct LoggedRequest {
    QString debugName;
    QString model;
    QString requestId;
    ChatLocation location = ChatLocation::Panel;
    QList<ChatMessage> messages;
    QJsonObject body;
    bool ignoreStatefulMarker = false;
};

class IPendingRequest {
public:
    virtual ~IPendingRequest() = default;
    virtual void markTimeToFirstToken(qint64 ms) = 0;
    virtual void resolve(const ChatResponse& result, const QList<RecordedDelta>& deltas) = 0;
    virtual void resolveCancelled() = 0;
};

class IRequestLogger {
public:
    virtual ~IRequestLogger() = default;
    virtual std::unique_ptr<IPendingRequest> begin(const LoggedRequest& request) = 0;
};

struct MadeRequestEvent {
    QList<ChatMessage> messages;
    QString model;
    QString sourceId;
    int tokenCount = -1;
};
