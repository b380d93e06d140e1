#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QString type;
    QByteArray data;
};

// Incremental Server-Sent Events decoder. Bytes are fed as they arrive;
// complete events come back in order. Comments, id: and retry: fields are
// dropped, multiple data: lines are joined with '\n'. The "[DONE]" sentinel
// ends the stream and is not returned as an event.
class SseDecoder {
public:
    QList<SseEvent> feed(const QByteArray& bytes);
    // Flushes a trailing event that was not terminated by a blank line.
    QList<SseEvent> finish();

    bool isDone() const { return m_done; }
    void reset();

private:
    QByteArray m_buffer;
    bool m_done = false;

    void drainBlocks(QList<SseEvent>& out);
    void parseBlock(const QByteArray& block, QList<SseEvent>& out);
};
