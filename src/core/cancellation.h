#pragma once
#include <QObject>
#include <atomic>

// One token is shared by a top-level fetch and every retry it spawns.
// cancel() may be called from any thread; the signal is emitted once.
class CancellationToken : public QObject {
    Q_OBJECT

public:
    explicit CancellationToken(QObject* parent = nullptr);

    bool isCancellationRequested() const { return m_cancelled.load(std::memory_order_acquire); }
    void cancel();

signals:
    void cancellationRequested();

private:
    std::atomic_bool m_cancelled{false};
};
