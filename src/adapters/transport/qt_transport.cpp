#include "qt_transport.h"
#include "core/cancellation.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QNetworkInformation>
#include <QUrl>

namespace {

const QString kLogCategory = QStringLiteral("transport");

enum class WaitResult { Ready, Cancelled };

bool headersReady(QNetworkReply* reply)
{
    return reply->isFinished()
        || reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid();
}

bool bodyProgress(QNetworkReply* reply)
{
    return reply->isFinished() || reply->bytesAvailable() > 0;
}

// Spins a local event loop until `ready` holds or the token fires. Conditions are re-checked before entering the loop so a
// signal that fired earlier is never missed.
template<typename Predicate>
WaitResult waitFor(QNetworkReply* reply, const CancellationToken& token, Predicate ready)
{
    if (token.isCancellationRequested())
        return WaitResult::Cancelled;
    if (ready(reply))
        return WaitResult::Ready;

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&token, &CancellationToken::cancellationRequested, &loop, &QEventLoop::quit);

    while (!ready(reply)) {
        if (token.isCancellationRequested())
            return WaitResult::Cancelled;
        loop.exec();
    }
    return token.isCancellationRequested() ? WaitResult::Cancelled : WaitResult::Ready;
}

// Content and server error codes only say the HTTP status was not 2xx; the
// body is still a valid response the classifier has to see.
bool isHttpStatusError(QNetworkReply::NetworkError code)
{
    const int value = static_cast<int>(code);
    return (value >= 201 && value <= 299) || (value >= 401 && value <= 499);
}

bool reportsOffline()
{
    const QNetworkInformation* info = QNetworkInformation::instance();
    return info && info->reachability() == QNetworkInformation::Reachability::Disconnected;
}

class QtRawResponse : public IRawResponse {
public:
    QtRawResponse(QNetworkReply* reply, QNetworkAccessManager* nam, ConnectionPool& pool)
        : m_reply(reply)
        , m_nam(nam)
        , m_pool(pool)
    {
        m_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        m_statusText = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        for (const auto& pair : reply->rawHeaderPairs())
            m_headers[QString::fromLatin1(pair.first).toLower()] = QString::fromUtf8(pair.second);
    }

    ~QtRawResponse() override
    {
        if (m_reply->isRunning())
            m_reply->abort();
        m_reply->deleteLater();
        m_pool.release(m_nam);
    }

    int status() const override { return m_status; }
    QString statusText() const override { return m_statusText; }
    HttpHeaders headers() const override { return m_headers; }

    TransportResult<std::optional<QByteArray>> read(const CancellationToken& token) override
    {
        for (;;) {
            if (m_destroyed)
                return std::unexpected(TransportError::aborted(QStringLiteral("stream destroyed")));
            if (token.isCancellationRequested())
                return std::unexpected(TransportError::aborted(QStringLiteral("stream read cancelled")));
            if (m_reply->bytesAvailable() > 0)
                return std::optional<QByteArray>(m_reply->readAll());
            if (m_reply->isFinished())
                return finishedState();

            waitFor(m_reply, token, bodyProgress);
        }
    }

    TransportResult<QByteArray> text(const CancellationToken& token) override
    {
        QByteArray all;
        for (;;) {
            auto chunk = read(token);
            if (!chunk.has_value())
                return std::unexpected(chunk.error());
            if (!chunk->has_value())
                return all;
            all.append(**chunk);
        }
    }

    void destroy() override
    {
        if (m_destroyed)
            return;
        m_destroyed = true;
        if (m_reply->isRunning()) {
            LOG_CAT_DEBUG(kLogCategory, QStringLiteral("Aborting in-flight stream for %1")
                                            .arg(m_reply->url().toString()));
            m_reply->abort();
        }
    }

private:
    QNetworkReply* m_reply;
    QNetworkAccessManager* m_nam;
    ConnectionPool& m_pool;
    int m_status = 0;
    QString m_statusText;
    HttpHeaders m_headers;
    bool m_destroyed = false;

    TransportResult<std::optional<QByteArray>> finishedState() const
    {
        const QNetworkReply::NetworkError code = m_reply->error();
        if (code == QNetworkReply::NoError || isHttpStatusError(code))
            return std::optional<QByteArray>();
        return std::unexpected(QtTransport::mapReplyError(code, m_reply->errorString()));
    }
};

} // namespace

QtTransport::QtTransport(ConnectionPool& pool, QtTransportOptions options)
    : m_pool(pool)
    , m_options(std::move(options))
{
}

QNetworkRequest QtTransport::buildQtRequest(const TransportRequest& request) const
{
    QNetworkRequest req{QUrl{request.url}};
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("content-type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setAttribute(QNetworkRequest::Http2AllowedAttribute, m_options.http2Allowed);
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    return req;
}

TransportError QtTransport::mapReplyError(QNetworkReply::NetworkError code, const QString& message)
{
    const int numeric = static_cast<int>(code);
    switch (code) {
    case QNetworkReply::OperationCanceledError:
        return TransportError::aborted(message);
    case QNetworkReply::RemoteHostClosedError:
        return TransportError::prematureClose(message);
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
        return TransportError::networkChanged(message, numeric);
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::UnknownNetworkError:
        if (reportsOffline())
            return TransportError::internetDisconnected(message, numeric);
        return TransportError::fetcher(message, numeric);
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::ProxyAuthenticationRequiredError:
    case QNetworkReply::UnknownProxyError:
        return TransportError::fetcher(message, numeric);
    default:
        return TransportError::generic(message, numeric);
    }
}

QString QtTransport::userMessageForError(const TransportError& error) const
{
    if (error.code == 0)
        return error.message;
    return QStringLiteral("%1 (network error %2)").arg(error.message).arg(error.code);
}

TransportResult<std::unique_ptr<IRawResponse>> QtTransport::send(const TransportRequest& request,
                                                                 const CancellationToken& token)
{
    if (token.isCancellationRequested())
        return std::unexpected(TransportError::aborted(QStringLiteral("request cancelled before send")));

    QNetworkAccessManager* nam = m_pool.acquire();
    const QNetworkRequest req = buildQtRequest(request);

    const QString method = request.method.trimmed().toUpper();
    QNetworkReply* reply = nullptr;
    if (method == QStringLiteral("POST"))
        reply = nam->post(req, request.body);
    else if (method == QStringLiteral("GET"))
        reply = nam->get(req);
    else
        reply = nam->sendCustomRequest(req, method.toUtf8(), request.body);

    LOG_CAT_DEBUG(kLogCategory, QStringLiteral("[%1] %2 %3 (request %4)")
                                    .arg(m_options.id, method, request.url, request.requestId));

    auto discard = [&]() {
        if (reply->isRunning())
            reply->abort();
        reply->deleteLater();
        m_pool.release(nam);
    };

    if (waitFor(reply, token, headersReady) == WaitResult::Cancelled) {
        discard();
        return std::unexpected(TransportError::aborted(QStringLiteral("request cancelled")));
    }

    if (!reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid()) {
        const TransportError error = reply->error() == QNetworkReply::NoError
            ? TransportError::generic(QStringLiteral("connection closed without a response"))
            : mapReplyError(reply->error(), reply->errorString());
        LOG_CAT_WARNING(kLogCategory, QStringLiteral("[%1] %2 failed: %3")
                                          .arg(m_options.id, request.url, error.message));
        discard();
        return std::unexpected(error);
    }

    return std::make_unique<QtRawResponse>(reply, nam, m_pool);
}
