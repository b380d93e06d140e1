#include <QTest>
#include "fetch/stream_recorder.h"

class TestStreamRecorder : public QObject {
    Q_OBJECT

private:
    static ResponseDelta textDelta(const QString& text) {
        ResponseDelta d;
        d.text = text;
        return d;
    }

private slots:
    void testForwardsInOrder() {
        QStringList seen;
        StreamRecorder recorder([&](const QString& text, int index, const ResponseDelta& delta) -> std::optional<int> {
            seen.append(QStringLiteral("%1:%2:%3").arg(index).arg(text, delta.text));
            return std::nullopt;
        });
        FinishedCallback cb = recorder.callback();

        cb(QStringLiteral("He"), 0, textDelta(QStringLiteral("He")));
        cb(QStringLiteral("Hi"), 1, textDelta(QStringLiteral("Hi")));
        cb(QStringLiteral("Hello"), 0, textDelta(QStringLiteral("llo")));

        QCOMPARE(seen, QStringList({QStringLiteral("0:He:He"),
                                    QStringLiteral("1:Hi:Hi"),
                                    QStringLiteral("0:Hello:llo")}));
        QCOMPARE(recorder.deltas().size(), 3);
        QCOMPARE(recorder.deltas().at(2).text, QStringLiteral("Hello"));
        QCOMPARE(recorder.deltas().at(1).index, 1);
    }

    void testPropagatesTrimOffset() {
        StreamRecorder recorder([](const QString& text, int, const ResponseDelta&) -> std::optional<int> {
            if (text.contains(QStringLiteral("STOP")))
                return int(text.indexOf(QStringLiteral("STOP")));
            return std::nullopt;
        });

        QCOMPARE(recorder.record(QStringLiteral("abc"), 0, textDelta(QStringLiteral("abc"))),
                 std::optional<int>());
        QCOMPARE(recorder.record(QStringLiteral("abcSTOP"), 0, textDelta(QStringLiteral("STOP"))),
                 std::optional<int>(3));
    }

    void testFirstTokenTimeOnlyForVisibleDeltas() {
        StreamRecorder recorder;
        ResponseDelta thinking;
        thinking.thinking = QStringLiteral("hmm");
        recorder.record(QString(), 0, thinking);
        QVERIFY(!recorder.firstTokenEmittedTime().has_value());

        ResponseDelta marker;
        marker.retryReason = QStringLiteral("copyright");
        recorder.record(QString(), 0, marker);
        QVERIFY(!recorder.firstTokenEmittedTime().has_value());

        recorder.record(QStringLiteral("x"), 0, textDelta(QStringLiteral("x")));
        QVERIFY(recorder.firstTokenEmittedTime().has_value());
        const qint64 first = *recorder.firstTokenEmittedTime();

        recorder.record(QStringLiteral("xy"), 0, textDelta(QStringLiteral("y")));
        QCOMPARE(*recorder.firstTokenEmittedTime(), first);
        QCOMPARE(recorder.deltas().size(), 4);
    }

    void testToolCallDeltaCountsAsVisible() {
        StreamRecorder recorder;
        ResponseDelta d;
        d.toolCalls.append(ToolCallDelta{0, QStringLiteral("call_1"), QStringLiteral("read_file"), QString()});
        recorder.record(QString(), 0, d);
        QVERIFY(recorder.firstTokenEmittedTime().has_value());
    }
};

QTEST_MAIN(TestStreamRecorder)
#include "tst_stream_recorder.moc"
