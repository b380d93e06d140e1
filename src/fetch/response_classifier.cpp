#include "response_classifier.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocale>
#include <QTimeZone>

namespace {

struct ParsedBody {
    QString text;
    std::optional<QJsonObject> json;
};

ParsedBody parseBody(const QByteArray& body)
{
    ParsedBody parsed;
    parsed.text = QString::fromUtf8(body);

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return parsed;

    const QJsonObject root = doc.object();
    // Providers nest the useful part under "error" most of the time.
    const QJsonValue nested = root.value(QStringLiteral("error"));
    parsed.json = nested.isObject() ? nested.toObject() : root;
    return parsed;
}

QString jsonString(const ParsedBody& body, const QString& key)
{
    if (!body.json)
        return {};
    return body.json->value(key).toString();
}

std::optional<int> parseSeconds(const QString& value)
{
    bool ok = false;
    const int seconds = value.trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return seconds;
}

ChatRequestFailed make(FailKind kind, const QString& reason, const ModelRequestId& ids)
{
    ChatRequestFailed f;
    f.failKind = kind;
    f.reason = reason;
    f.modelRequestId = ids;
    return f;
}

} // namespace

namespace ResponseClassifier {

std::optional<QDateTime> parseRetryAfter(const QString& value, const QDateTime& now)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty())
        return std::nullopt;

    // A bare integer is a delay; checked first so "120" is never read as a year.
    if (auto seconds = parseSeconds(trimmed))
        return now.addSecs(*seconds);

    QDateTime date = QDateTime::fromString(trimmed, Qt::RFC2822Date);
    if (!date.isValid()) {
        // RFC 7231 IMF-fixdate, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
        date = QLocale::c().toDateTime(trimmed, QStringLiteral("ddd, dd MMM yyyy HH:mm:ss 'GMT'"));
        if (date.isValid())
            date.setTimeZone(QTimeZone::utc());
    }
    if (!date.isValid())
        date = QDateTime::fromString(trimmed, Qt::ISODate);
    if (!date.isValid())
        return std::nullopt;
    return date.toUTC();
}

ModelRequestId requestIdFromHeaders(const HttpHeaders& headers)
{
    ModelRequestId ids;
    ids.headerRequestId = headers.value(QStringLiteral("x-request-id"));
    ids.serverRequestId = headers.value(QStringLiteral("x-github-request-id"));
    if (ids.serverRequestId.isEmpty())
        ids.serverRequestId = headers.value(QStringLiteral("apim-request-id"));
    ids.completionId = headers.value(QStringLiteral("x-completion-id"));
    return ids;
}

ChatRequestFailed classify(int httpStatus,
                           const QByteArray& body,
                           const HttpHeaders& headers,
                           const QDateTime& now)
{
    const ParsedBody parsed = parseBody(body);
    const ModelRequestId ids = requestIdFromHeaders(headers);
    const QString message = jsonString(parsed, QStringLiteral("message"));
    const QString code = jsonString(parsed, QStringLiteral("code"));

    if (httpStatus >= 400 && httpStatus < 500) {
        if (httpStatus == 400 && parsed.text.contains(QStringLiteral("off_topic"))) {
            return make(FailKind::OffTopic,
                        QStringLiteral("filtered as off_topic by intent classifier: "
                                       "message was not programming related"),
                        ids);
        }

        if (httpStatus == 400 && code == QStringLiteral("previous_response_not_found")) {
            auto f = make(FailKind::InvalidStatefulMarker,
                          message.isEmpty() ? QStringLiteral("Invalid previous response ID") : message,
                          ids);
            f.errorData = parsed.json.value_or(QJsonObject{});
            return f;
        }

        if (httpStatus == 401) {
            const QString authorizeUrl = jsonString(parsed, QStringLiteral("authorize_url"));
            if (!authorizeUrl.isEmpty()) {
                auto f = make(FailKind::AgentUnauthorized,
                              message.isEmpty() ? QStringLiteral("Unauthorized") : message,
                              ids);
                f.authorizeUrl = authorizeUrl;
                f.errorData = *parsed.json;
                return f;
            }
        }

        if (httpStatus == 401 || httpStatus == 403) {
            return make(FailKind::TokenExpiredOrInvalid,
                        message.isEmpty()
                            ? QStringLiteral("token expired or invalid: %1").arg(httpStatus)
                            : message,
                        ids);
        }

        if (httpStatus == 402) {
            auto f = make(FailKind::QuotaExceeded,
                          message.isEmpty() ? QStringLiteral("Free tier quota exceeded") : message,
                          ids);
            const QString retryAfter = headers.value(QStringLiteral("retry-after"));
            f.retryAfter = parseRetryAfter(retryAfter, now);
            f.retryAfterSeconds = parseSeconds(retryAfter);
            f.errorData = parsed.json.value_or(QJsonObject{});
            return f;
        }

        if (httpStatus == 404) {
            const QString reason = parsed.json
                ? QString::fromUtf8(QJsonDocument(*parsed.json).toJson(QJsonDocument::Compact))
                : parsed.text;
            return make(FailKind::NotFound, reason, ids);
        }

        if (httpStatus == 422)
            return make(FailKind::ContentFilter, QStringLiteral("Filtered by Responsible AI Service"), ids);

        if (httpStatus == 424)
            return make(FailKind::AgentFailedDependency, parsed.text, ids);

        if (httpStatus == 429) {
            const QString retryAfter = headers.value(QStringLiteral("retry-after"));

            if (code == QStringLiteral("extension_blocked")) {
                auto f = make(FailKind::ExtensionBlocked, QStringLiteral("Extension blocked"), ids);
                f.retryAfterSeconds = parseSeconds(retryAfter).value_or(kExtensionBlockedDefaultRetrySeconds);
                f.retryAfter = now.addSecs(*f.retryAfterSeconds);
                f.errorData = *parsed.json;
                return f;
            }

            QString reason = message.isEmpty() ? code : message;
            if (reason.isEmpty())
                reason = parsed.text;
            auto f = make(FailKind::RateLimited, reason, ids);
            f.retryAfter = parseRetryAfter(retryAfter, now);
            f.retryAfterSeconds = parseSeconds(retryAfter);
            f.rateLimitKey = headers.value(QStringLiteral("x-ratelimit-exceeded"));
            f.errorData = parsed.json.value_or(QJsonObject{});
            return f;
        }

        if (httpStatus == 466)
            return make(FailKind::ClientNotSupported,
                        QStringLiteral("client not supported: %1").arg(parsed.text), ids);

        if (httpStatus == 499)
            return make(FailKind::ServerCanceled, QStringLiteral("canceled by server"), ids);

    } else if (httpStatus >= 500 && httpStatus < 600) {
        if (httpStatus == 503) {
            auto f = make(FailKind::RateLimited, QStringLiteral("Upstream provider rate limit hit"), ids);
            QJsonObject capiError;
            capiError[QStringLiteral("code")] = QStringLiteral("upstream_provider_rate_limit");
            capiError[QStringLiteral("message")] = parsed.text;
            f.errorData = capiError;
            return f;
        }

        return make(FailKind::ServerError, QStringLiteral("Server error: %1").arg(httpStatus), ids);
    }

    return make(FailKind::Unknown,
                QStringLiteral("Request Failed: %1 %2").arg(httpStatus).arg(parsed.text),
                ids);
}

}
