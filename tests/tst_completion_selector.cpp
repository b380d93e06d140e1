#include <QTest>
#include "fetch/completion_selector.h"

namespace {

class RecordingTelemetry : public ITelemetrySink {
public:
    QStringList events;

    void sendEvent(const QString& name, const TelemetryProperties&, const TelemetryMeasurements&) noexcept override {
        events.append(name);
    }
    void sendException(const QString&, const QString&) noexcept override {}
};

ChatCompletion completion(int index, const QString& text, FinishReason reason) {
    ChatCompletion c;
    c.index = index;
    c.model = QStringLiteral("gpt-test");
    c.finishReason = reason;
    c.message = ChatMessage::assistant(text);
    for (const QString& word : text.split(QLatin1Char(' ')))
        c.tokens.append(word);
    c.requestId.headerRequestId = QStringLiteral("hdr-%1").arg(index);
    return c;
}

ChatCompletion looping(int index) {
    ChatCompletion c = completion(index, QString(), FinishReason::Stop);
    for (int i = 0; i < 12; ++i)
        c.tokens.append(QStringLiteral("again"));
    c.message = ChatMessage::assistant(c.tokens.join(QString()));
    return c;
}

}

class TestCompletionSelector : public QObject {
    Q_OBJECT

private slots:
    void testSingleSuccess() {
        CompletionSelector selector;
        ChatCompletion c = completion(0, QStringLiteral("hello world"), FinishReason::Stop);
        c.usage = Usage{10, 2, 12};

        const SelectionResult r = selector.select({c}, QStringLiteral("req-1"));
        QCOMPARE(r.response.type, ChatResponseType::Success);
        QCOMPARE(r.response.value, QStringList{QStringLiteral("hello world")});
        QCOMPARE(r.response.resolvedModel, QStringLiteral("gpt-test"));
        QCOMPARE(r.response.requestId, QStringLiteral("req-1"));
        QVERIFY(r.response.usage.has_value());
        QCOMPARE(r.response.usage->totalTokens, 12);
    }

    void testUsageOnlyForSingleCandidate() {
        CompletionSelector selector;
        ChatCompletion a = completion(0, QStringLiteral("one"), FinishReason::Stop);
        ChatCompletion b = completion(1, QStringLiteral("two"), FinishReason::ToolCalls);
        a.usage = Usage{1, 1, 2};

        const SelectionResult r = selector.select({a, b}, QStringLiteral("req"));
        QCOMPARE(r.response.value, QStringList({QStringLiteral("one"), QStringLiteral("two")}));
        QVERIFY(!r.response.usage.has_value());
    }

    void testRepetitiveCandidateDropped() {
        RecordingTelemetry telemetry;
        CompletionSelector selector(&telemetry);

        const SelectionResult r = selector.select(
            {looping(0), completion(1, QStringLiteral("clean answer"), FinishReason::Stop)},
            QStringLiteral("req"));

        QCOMPARE(r.response.type, ChatResponseType::Success);
        QCOMPARE(r.response.value, QStringList{QStringLiteral("clean answer")});
        QCOMPARE(r.repetitiveCount, 1);
        QCOMPARE(r.candidateCount, 2);
        QVERIFY(telemetry.events.contains(QStringLiteral("conversation.repetition.detected")));
    }

    void testOnlyRepetitiveIsNotSuccess() {
        CompletionSelector selector;
        const SelectionResult r = selector.select({looping(0)}, QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::Unknown);
        QCOMPARE(r.response.reason, QStringLiteral("Response contained no choices."));
    }

    void testNoChoices() {
        CompletionSelector selector;
        const SelectionResult r = selector.select({}, QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::Unknown);
        QCOMPARE(r.candidateCount, 0);
    }

    void testFilteredCarriesContentForRetry() {
        CompletionSelector selector;
        ChatCompletion c = completion(0, QStringLiteral("partial text"), FinishReason::ContentFilter);
        c.filterReason = FilterCategory::Hate;

        const SelectionResult r = selector.select({c}, QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::FilteredRetry);
        QCOMPARE(r.response.category, std::optional<FilterCategory>(FilterCategory::Hate));
        QCOMPARE(r.response.value, QStringList{QStringLiteral("partial text")});
    }

    void testFilteredDefaultsToCopyright() {
        CompletionSelector selector;
        const SelectionResult r = selector.select(
            {completion(0, QStringLiteral("x"), FinishReason::ContentFilter)}, QStringLiteral("req"));
        QCOMPARE(r.response.category, std::optional<FilterCategory>(FilterCategory::Copyright));
    }

    void testLength() {
        CompletionSelector selector;
        const SelectionResult r = selector.select(
            {completion(0, QStringLiteral("cut off"), FinishReason::Length)}, QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::Length);
        QCOMPARE(r.response.truncatedValue, QStringLiteral("cut off"));
    }

    void testStreamServerError() {
        CompletionSelector selector;
        ChatCompletion c = completion(0, QString(), FinishReason::ServerError);
        c.error = QStringLiteral("overloaded");
        const SelectionResult r = selector.select({c}, QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::ServerError);
        QCOMPARE(r.response.streamError, QStringLiteral("overloaded"));
    }

    void testFirstNonRepetitiveDecidesFailure() {
        CompletionSelector selector;
        const SelectionResult r = selector.select(
            {looping(0),
             completion(1, QStringLiteral("long"), FinishReason::Length),
             completion(2, QStringLiteral("bad"), FinishReason::ContentFilter)},
            QStringLiteral("req"));
        QCOMPARE(r.response.type, ChatResponseType::Length);
        QCOMPARE(r.response.serverRequestId, QStringLiteral("hdr-1"));
    }

    void testSuccessfulFinishReasons() {
        QVERIFY(CompletionSelector::isSuccessfulFinish(FinishReason::Stop));
        QVERIFY(CompletionSelector::isSuccessfulFinish(FinishReason::ClientTrimmed));
        QVERIFY(CompletionSelector::isSuccessfulFinish(FinishReason::FunctionCall));
        QVERIFY(CompletionSelector::isSuccessfulFinish(FinishReason::ToolCalls));
        QVERIFY(!CompletionSelector::isSuccessfulFinish(FinishReason::Length));
        QVERIFY(!CompletionSelector::isSuccessfulFinish(FinishReason::ContentFilter));
    }
};

QTEST_MAIN(TestCompletionSelector)
#include "tst_completion_selector.moc"
