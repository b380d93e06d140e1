#include "log_telemetry_sink.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>

namespace {
const QString kLogCategory = QStringLiteral("telemetry");
}

LogTelemetrySink::LogTelemetrySink(QObject* parent)
    : QObject(parent)
{
}

LogTelemetrySink::~LogTelemetrySink()
{
    flush();
}

QString LogTelemetrySink::formatEvent(const QString& name,
                                      const TelemetryProperties& properties,
                                      const TelemetryMeasurements& measurements)
{
    QJsonObject props;
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it)
        props[it.key()] = it.value();
    QJsonObject values;
    for (auto it = measurements.constBegin(); it != measurements.constEnd(); ++it)
        values[it.key()] = it.value();

    QJsonObject event;
    event[QStringLiteral("properties")] = props;
    event[QStringLiteral("measurements")] = values;
    return name + QLatin1Char(' ') + QString::fromUtf8(QJsonDocument(event).toJson(QJsonDocument::Compact));
}

void LogTelemetrySink::sendEvent(const QString& name,
                                 const TelemetryProperties& properties,
                                 const TelemetryMeasurements& measurements) noexcept
{
    enqueue({false, formatEvent(name, properties, measurements)});
}

void LogTelemetrySink::sendException(const QString& origin, const QString& message) noexcept
{
    enqueue({true, QStringLiteral("exception [%1]: %2").arg(origin, message)});
}

void LogTelemetrySink::enqueue(Entry entry)
{
    bool first = false;
    {
        QMutexLocker locker(&m_mutex);
        if (!entry.exception)
            ++m_events;
        first = m_pending.isEmpty();
        m_pending.append(std::move(entry));
    }
    // One drain is scheduled per batch.
    if (first)
        QMetaObject::invokeMethod(this, &LogTelemetrySink::flush, Qt::QueuedConnection);
}

void LogTelemetrySink::flush()
{
    QList<Entry> batch;
    {
        QMutexLocker locker(&m_mutex);
        batch.swap(m_pending);
    }
    for (const Entry& entry : batch) {
        if (entry.exception)
            LOG_CAT_WARNING(kLogCategory, entry.text);
        else
            LOG_CAT_DEBUG(kLogCategory, entry.text);
    }
}

int LogTelemetrySink::eventCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_events;
}

int LogTelemetrySink::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_pending.size();
}
