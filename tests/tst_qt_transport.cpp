#include <QTest>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include "adapters/transport/qt_transport.h"
#include "core/cancellation.h"

namespace {

// Accepts connections and then goes quiet. With `sendHeaders` it answers the
// first request bytes with a streaming 200 and never writes a body.
class StalledServer : public QObject {
    Q_OBJECT

public:
    explicit StalledServer(bool sendHeaders)
        : m_sendHeaders(sendHeaders)
    {
        connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                m_sockets.append(socket);
                if (m_sendHeaders) {
                    connect(socket, &QTcpSocket::readyRead, socket, [socket]() {
                        socket->readAll();
                        if (socket->property("answered").toBool())
                            return;
                        socket->setProperty("answered", true);
                        socket->write("HTTP/1.1 200 OK\r\n"
                                      "Content-Type: text/event-stream\r\n"
                                      "Transfer-Encoding: chunked\r\n"
                                      "\r\n");
                        socket->flush();
                    });
                }
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    QString url() const {
        return QStringLiteral("http://127.0.0.1:%1/chat/completions").arg(m_server.serverPort());
    }

private:
    QTcpServer m_server;
    QList<QTcpSocket*> m_sockets;
    bool m_sendHeaders;
};

TransportRequest chatRequest(const QString& url) {
    TransportRequest request;
    request.url = url;
    request.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
    request.body = R"({"model":"m","messages":[],"stream":true})";
    request.requestId = QStringLiteral("req-stall");
    return request;
}

QtTransportOptions plainHttp() {
    QtTransportOptions options;
    options.http2Allowed = false;
    return options;
}

}

class TestQtTransport : public QObject {
    Q_OBJECT

private slots:
    void testCancelledBeforeSendMakesNoRequest() {
        ConnectionPool pool(2);
        QtTransport transport(pool, plainHttp());
        CancellationToken token;
        token.cancel();

        auto result = transport.send(chatRequest(QStringLiteral("http://127.0.0.1:9/")), token);
        QVERIFY(!result.has_value());
        QVERIFY(transport.isAbortError(result.error()));
        QCOMPARE(pool.createdCount(), 0);
    }

    void testStalledHeadersEndOnlyWhenCancelled() {
        StalledServer server(false);
        QVERIFY(server.listen());

        ConnectionPool pool(2);
        QtTransport transport(pool, plainHttp());
        CancellationToken token;
        QTimer::singleShot(400, &token, &CancellationToken::cancel);

        QElapsedTimer elapsed;
        elapsed.start();
        auto result = transport.send(chatRequest(server.url()), token);

        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, TransportErrorKind::Aborted);
        QVERIFY(elapsed.elapsed() >= 350);
        QCOMPARE(pool.activeCount(), 0);
    }

    void testStalledBodyEndsOnlyWhenCancelled() {
        StalledServer server(true);
        QVERIFY(server.listen());

        ConnectionPool pool(2);
        QtTransport transport(pool, plainHttp());
        CancellationToken token;

        auto sent = transport.send(chatRequest(server.url()), token);
        QVERIFY(sent.has_value());
        std::unique_ptr<IRawResponse> response = std::move(sent.value());
        QCOMPARE(response->status(), 200);
        QCOMPARE(response->header(QStringLiteral("content-type")), QStringLiteral("text/event-stream"));

        QTimer::singleShot(400, &token, &CancellationToken::cancel);
        QElapsedTimer elapsed;
        elapsed.start();
        auto chunk = response->read(token);

        QVERIFY(!chunk.has_value());
        QVERIFY(transport.isAbortError(chunk.error()));
        QVERIFY(elapsed.elapsed() >= 350);

        response.reset();
        QCOMPARE(pool.activeCount(), 0);
    }
};

QTEST_MAIN(TestQtTransport)
#include "tst_qt_transport.moc"
