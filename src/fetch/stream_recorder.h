#pragma once
#include "chat/completion.h"
#include "chat/ports.h"
#include <QList>
#include <optional>

// Sits between the endpoint's stream decoder and the caller's callback.
// Forwards every delta unchanged and in order, keeps a copy for the request
// log and notes when the first visible token went out.
class StreamRecorder {
public:
    explicit StreamRecorder(FinishedCallback downstream = {});

    StreamRecorder(const StreamRecorder&) = delete;
    StreamRecorder& operator=(const StreamRecorder&) = delete;

    // Bound to this recorder; must not outlive it.
    FinishedCallback callback();

    std::optional<int> record(const QString& text, int index, const ResponseDelta& delta);

    const QList<RecordedDelta>& deltas() const { return m_deltas; }
    std::optional<qint64> firstTokenEmittedTime() const { return m_firstTokenEmittedTime; }

private:
    FinishedCallback m_downstream;
    QList<RecordedDelta> m_deltas;
    std::optional<qint64> m_firstTokenEmittedTime;
};
