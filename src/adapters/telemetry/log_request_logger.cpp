#include "log_request_logger.h"
#include "core/log_manager.h"
#include <QDateTime>
#include <QJsonDocument>

namespace {

const QString kLogCategory = QStringLiteral("request");

class LoggedPendingRequest : public IPendingRequest {
public:
    explicit LoggedPendingRequest(const LoggedRequest& request)
        : m_debugName(request.debugName)
        , m_requestId(request.requestId)
        , m_startMs(QDateTime::currentMSecsSinceEpoch())
    {
    }

    void markTimeToFirstToken(qint64 ms) override { m_timeToFirstToken = ms; }

    void resolve(const ChatResponse& result, const QList<RecordedDelta>& deltas) override
    {
        const qint64 elapsed = QDateTime::currentMSecsSinceEpoch() - m_startMs;
        QString line = QStringLiteral("%1 [%2] resolved %3 in %4 ms (first token %5 ms, %6 deltas)")
                           .arg(m_debugName, m_requestId, chatResponseTypeName(result.type))
                           .arg(elapsed)
                           .arg(m_timeToFirstToken)
                           .arg(deltas.size());
        if (!result.isSuccess() && !result.reason.isEmpty())
            line += QStringLiteral(": ") + result.reason;
        LOG_CAT_INFO(kLogCategory, line);
    }

    void resolveCancelled() override
    {
        LOG_CAT_INFO(kLogCategory, QStringLiteral("%1 [%2] cancelled after %3 ms")
                                       .arg(m_debugName, m_requestId)
                                       .arg(QDateTime::currentMSecsSinceEpoch() - m_startMs));
    }

private:
    QString m_debugName;
    QString m_requestId;
    qint64 m_startMs;
    qint64 m_timeToFirstToken = -1;
};

} // namespace

std::unique_ptr<IPendingRequest> LogRequestLogger::begin(const LoggedRequest& request)
{
    LOG_CAT_INFO(kLogCategory, QStringLiteral("%1 [%2] %3 messages to %4 (%5)")
                                   .arg(request.debugName, request.requestId)
                                   .arg(request.messages.size())
                                   .arg(request.model, chatLocationName(request.location)));
    LOG_CAT_DEBUG(kLogCategory, QString::fromUtf8(QJsonDocument(request.body).toJson(QJsonDocument::Compact)));
    return std::make_unique<LoggedPendingRequest>(request);
}
