#include "sse_decoder.h"

QList<SseEvent> SseDecoder::feed(const QByteArray& bytes)
{
    QList<SseEvent> out;
    if (m_done)
        return out;
    m_buffer.append(bytes);
    drainBlocks(out);
    return out;
}

QList<SseEvent> SseDecoder::finish()
{
    QList<SseEvent> out;
    if (!m_done && !m_buffer.trimmed().isEmpty()) {
        m_buffer.append("\n\n");
        drainBlocks(out);
    }
    m_buffer.clear();
    return out;
}

void SseDecoder::reset()
{
    m_buffer.clear();
    m_done = false;
}

void SseDecoder::drainBlocks(QList<SseEvent>& out)
{
    while (!m_done) {
        // Events are delimited by a blank line; "\r\n\r\n" is checked first
        // so a CRLF stream is never split in the middle of a delimiter.
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);
        parseBlock(block, out);
    }
}

void SseDecoder::parseBlock(const QByteArray& block, QList<SseEvent>& out)
{
    QString eventType;
    QList<QByteArray> dataLines;

    for (const QByteArray& rawLine : block.split('\n')) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:"))
            eventType = QString::fromUtf8(line.mid(6).trimmed());
        else if (line.startsWith("data:"))
            dataLines.append(line.mid(5).trimmed());
        // id:, retry: and unknown fields are ignored.
    }

    if (dataLines.isEmpty())
        return;

    const QByteArray data = dataLines.join('\n');
    if (data == "[DONE]") {
        m_done = true;
        return;
    }
    if (data.isEmpty())
        return;

    out.append(SseEvent{eventType, data});
}
