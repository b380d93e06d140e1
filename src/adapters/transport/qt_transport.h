#pragma once
#include "chat/ports.h"
#include "connection_pool.h"
#include <QNetworkReply>
#include <QNetworkRequest>

struct QtTransportOptions {
    QString id = QStringLiteral("qt-pooled");
    bool http2Allowed = true;
};

// ITransport over QNetworkAccessManager. send() blocks in a local event loop
// until response headers arrive; the body is then pulled chunk by chunk
// through the returned IRawResponse. Waits end only on reply progress or on
// the cancellation token; callers bound a request by cancelling.
//
// The default transport uses a pooled ConnectionPool with HTTP/2; the
// alternate transport is the same class over a disabled pool with HTTP/2 off.
class QtTransport : public ITransport {
public:
    explicit QtTransport(ConnectionPool& pool, QtTransportOptions options = {});

    QString transportId() const override { return m_options.id; }
    TransportResult<std::unique_ptr<IRawResponse>> send(const TransportRequest& request,
                                                        const CancellationToken& token) override;
    QString userMessageForError(const TransportError& error) const override;

    const QtTransportOptions& options() const { return m_options; }

    static TransportError mapReplyError(QNetworkReply::NetworkError code, const QString& message);

private:
    ConnectionPool& m_pool;
    QtTransportOptions m_options;

    QNetworkRequest buildQtRequest(const TransportRequest& request) const;
};
