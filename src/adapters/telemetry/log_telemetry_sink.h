#pragma once
#include "chat/ports.h"
#include <QMutex>
#include <QObject>
#include <QStringList>

// Writes telemetry events to the "telemetry" log category at debug level.
// sendEvent() only formats and queues; the log write happens later on this
// object's thread, or in flush().
class LogTelemetrySink : public QObject, public ITelemetrySink {
    Q_OBJECT

public:
    explicit LogTelemetrySink(QObject* parent = nullptr);
    ~LogTelemetrySink() override;

    void sendEvent(const QString& name,
                   const TelemetryProperties& properties,
                   const TelemetryMeasurements& measurements) noexcept override;
    void sendException(const QString& origin, const QString& message) noexcept override;

    int eventCount() const;
    int pendingCount() const;

    static QString formatEvent(const QString& name,
                               const TelemetryProperties& properties,
                               const TelemetryMeasurements& measurements);

public slots:
    void flush();

private:
    struct Entry {
        bool exception = false;
        QString text;
    };

    void enqueue(Entry entry);

    QList<Entry> m_pending;
    int m_events = 0;
    mutable QMutex m_mutex;
};
