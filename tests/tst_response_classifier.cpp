#include <QTest>
#include <QTimeZone>
#include "fetch/response_classifier.h"

class TestResponseClassifier : public QObject {
    Q_OBJECT

private:
    static QDateTime fixedNow() {
        return QDateTime(QDate(2024, 5, 1), QTime(12, 0, 0), QTimeZone::utc());
    }

    static ChatRequestFailed classify(int status, const QByteArray& body, const HttpHeaders& headers = {}) {
        return ResponseClassifier::classify(status, body, headers, fixedNow());
    }

private slots:
    void testStatusTable_data() {
        QTest::addColumn<int>("status");
        QTest::addColumn<QByteArray>("body");
        QTest::addColumn<int>("kind");
        QTest::addColumn<QString>("reason");

        QTest::newRow("off-topic") << 400 << QByteArray(R"({"error":{"code":"off_topic"}})")
                                   << int(FailKind::OffTopic)
                                   << QStringLiteral("filtered as off_topic by intent classifier: "
                                                     "message was not programming related");
        QTest::newRow("stateful-marker")
            << 400 << QByteArray(R"({"error":{"code":"previous_response_not_found"}})")
            << int(FailKind::InvalidStatefulMarker) << QStringLiteral("Invalid previous response ID");
        QTest::newRow("plain-400") << 400 << QByteArray("nope")
                                   << int(FailKind::Unknown) << QStringLiteral("Request Failed: 400 nope");
        QTest::newRow("401") << 401 << QByteArray("") << int(FailKind::TokenExpiredOrInvalid)
                             << QStringLiteral("token expired or invalid: 401");
        QTest::newRow("403-message") << 403 << QByteArray(R"({"message":"forbidden"})")
                                     << int(FailKind::TokenExpiredOrInvalid) << QStringLiteral("forbidden");
        QTest::newRow("402") << 402 << QByteArray("{}") << int(FailKind::QuotaExceeded)
                             << QStringLiteral("Free tier quota exceeded");
        QTest::newRow("404-text") << 404 << QByteArray("missing") << int(FailKind::NotFound)
                                  << QStringLiteral("missing");
        QTest::newRow("422") << 422 << QByteArray("x") << int(FailKind::ContentFilter)
                             << QStringLiteral("Filtered by Responsible AI Service");
        QTest::newRow("424") << 424 << QByteArray("agent down") << int(FailKind::AgentFailedDependency)
                             << QStringLiteral("agent down");
        QTest::newRow("429-code") << 429 << QByteArray(R"({"error":{"code":"rate_limited"}})")
                                  << int(FailKind::RateLimited) << QStringLiteral("rate_limited");
        QTest::newRow("429-text") << 429 << QByteArray("slow down")
                                  << int(FailKind::RateLimited) << QStringLiteral("slow down");
        QTest::newRow("466") << 466 << QByteArray("update") << int(FailKind::ClientNotSupported)
                             << QStringLiteral("client not supported: update");
        QTest::newRow("499") << 499 << QByteArray() << int(FailKind::ServerCanceled)
                             << QStringLiteral("canceled by server");
        QTest::newRow("500") << 500 << QByteArray("boom") << int(FailKind::ServerError)
                             << QStringLiteral("Server error: 500");
        QTest::newRow("503") << 503 << QByteArray("busy") << int(FailKind::RateLimited)
                             << QStringLiteral("Upstream provider rate limit hit");
        QTest::newRow("302") << 302 << QByteArray("moved") << int(FailKind::Unknown)
                             << QStringLiteral("Request Failed: 302 moved");
    }

    void testStatusTable() {
        QFETCH(int, status);
        QFETCH(QByteArray, body);
        QFETCH(int, kind);
        QFETCH(QString, reason);

        const ChatRequestFailed failure = classify(status, body);
        QCOMPARE(int(failure.failKind), kind);
        QCOMPARE(failure.reason, reason);
    }

    void testAgentUnauthorizedCarriesUrl() {
        const auto failure = classify(401, R"({"authorize_url":"https://example.com/auth"})");
        QCOMPARE(failure.failKind, FailKind::AgentUnauthorized);
        QCOMPARE(failure.reason, QStringLiteral("Unauthorized"));
        QCOMPARE(failure.authorizeUrl, QStringLiteral("https://example.com/auth"));
        QVERIFY(!failure.invalidatesCredential());
    }

    void testCredentialInvalidatingKinds() {
        QVERIFY(classify(401, "").invalidatesCredential());
        QVERIFY(classify(403, "").invalidatesCredential());
        QVERIFY(classify(402, "").invalidatesCredential());
        QVERIFY(!classify(429, "").invalidatesCredential());
    }

    void testNotFoundCompactsJson() {
        const auto failure = classify(404, "{ \"error\" : { \"message\" : \"no model\" } }");
        QCOMPARE(failure.reason, QStringLiteral(R"({"message":"no model"})"));
    }

    void testQuotaRetryAfterSeconds() {
        HttpHeaders headers;
        headers[QStringLiteral("retry-after")] = QStringLiteral("120");
        const auto failure = classify(402, "{}", headers);
        QVERIFY(failure.retryAfter.has_value());
        QCOMPARE(*failure.retryAfter, fixedNow().addSecs(120));
        QCOMPARE(failure.retryAfterSeconds, std::optional<int>(120));
    }

    void testQuotaRetryAfterHttpDate() {
        HttpHeaders headers;
        headers[QStringLiteral("retry-after")] = QStringLiteral("Wed, 21 Oct 2015 07:28:00 GMT");
        const auto failure = classify(402, "{}", headers);
        QVERIFY(failure.retryAfter.has_value());
        const QDateTime expected(QDate(2015, 10, 21), QTime(7, 28, 0), QTimeZone::utc());
        QCOMPARE(failure.retryAfter->toSecsSinceEpoch(), expected.toSecsSinceEpoch());
        QVERIFY(!failure.retryAfterSeconds.has_value());
    }

    void testUnparseableRetryAfter() {
        QVERIFY(!ResponseClassifier::parseRetryAfter(QStringLiteral("soon"), fixedNow()).has_value());
        QVERIFY(!ResponseClassifier::parseRetryAfter(QString(), fixedNow()).has_value());
    }

    void testExtensionBlockedDefaultsRetry() {
        const auto failure = classify(429, R"({"error":{"code":"extension_blocked"}})");
        QCOMPARE(failure.failKind, FailKind::ExtensionBlocked);
        QCOMPARE(failure.reason, QStringLiteral("Extension blocked"));
        QCOMPARE(failure.retryAfterSeconds,
                 std::optional<int>(ResponseClassifier::kExtensionBlockedDefaultRetrySeconds));
        QCOMPARE(*failure.retryAfter, fixedNow().addSecs(300));
    }

    void testExtensionBlockedHonoursHeader() {
        HttpHeaders headers;
        headers[QStringLiteral("retry-after")] = QStringLiteral("60");
        const auto failure = classify(429, R"({"error":{"code":"extension_blocked"}})", headers);
        QCOMPARE(failure.retryAfterSeconds, std::optional<int>(60));
    }

    void testRateLimitKey() {
        HttpHeaders headers;
        headers[QStringLiteral("x-ratelimit-exceeded")] = QStringLiteral("user-hourly");
        headers[QStringLiteral("retry-after")] = QStringLiteral("5");
        const auto failure = classify(429, R"({"error":{"message":"too many"}})", headers);
        QCOMPARE(failure.reason, QStringLiteral("too many"));
        QCOMPARE(failure.rateLimitKey, QStringLiteral("user-hourly"));
        QCOMPARE(failure.retryAfterSeconds, std::optional<int>(5));
    }

    void testUpstreamRateLimitErrorData() {
        const auto failure = classify(503, "provider busy");
        QCOMPARE(failure.errorData.value(QStringLiteral("code")).toString(),
                 QStringLiteral("upstream_provider_rate_limit"));
        QCOMPARE(failure.errorData.value(QStringLiteral("message")).toString(),
                 QStringLiteral("provider busy"));
    }

    void testRequestIdsFromHeaders() {
        HttpHeaders headers;
        headers[QStringLiteral("x-request-id")] = QStringLiteral("hdr-1");
        headers[QStringLiteral("apim-request-id")] = QStringLiteral("apim-1");
        const auto failure = classify(500, "", headers);
        QCOMPARE(failure.modelRequestId.headerRequestId, QStringLiteral("hdr-1"));
        QCOMPARE(failure.modelRequestId.serverRequestId, QStringLiteral("apim-1"));

        headers[QStringLiteral("x-github-request-id")] = QStringLiteral("gh-1");
        QCOMPARE(ResponseClassifier::requestIdFromHeaders(headers).serverRequestId, QStringLiteral("gh-1"));
    }

    void testClassificationIsDeterministic() {
        HttpHeaders headers;
        headers[QStringLiteral("retry-after")] = QStringLiteral("30");
        const QByteArray body = R"({"error":{"message":"later"}})";
        const auto a = classify(429, body, headers);
        const auto b = classify(429, body, headers);
        QCOMPARE(a.failKind, b.failKind);
        QCOMPARE(a.reason, b.reason);
        QCOMPARE(a.retryAfter, b.retryAfter);
        QCOMPARE(a.errorData, b.errorData);
    }
};

QTEST_MAIN(TestResponseClassifier)
#include "tst_response_classifier.moc"
