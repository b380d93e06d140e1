#include "stream_recorder.h"
#include <QDateTime>

StreamRecorder::StreamRecorder(FinishedCallback downstream)
    : m_downstream(std::move(downstream))
{
}

FinishedCallback StreamRecorder::callback()
{
    return [this](const QString& text, int index, const ResponseDelta& delta) {
        return record(text, index, delta);
    };
}

std::optional<int> StreamRecorder::record(const QString& text, int index, const ResponseDelta& delta)
{
    const bool visible = !delta.text.isEmpty() || !delta.toolCalls.isEmpty();
    if (!m_firstTokenEmittedTime.has_value() && visible)
        m_firstTokenEmittedTime = QDateTime::currentMSecsSinceEpoch();

    std::optional<int> trimAt;
    if (m_downstream)
        trimAt = m_downstream(text, index, delta);

    m_deltas.append(RecordedDelta{index, text, delta});
    return trimAt;
}
