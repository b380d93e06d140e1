#pragma once
#include "chat/failure.h"
#include "chat/ports.h"
#include <QByteArray>
#include <QDateTime>
#include <optional>

// Maps a non-2xx provider response onto the closed FailKind taxonomy.
// Pure: the same (status, body, headers, now) always yields the same value,
// and nothing here touches credentials, logs or telemetry.
namespace ResponseClassifier {
    constexpr int kExtensionBlockedDefaultRetrySeconds = 300;

    ChatRequestFailed classify(int httpStatus,
                               const QByteArray& body,
                               const HttpHeaders& headers,
                               const QDateTime& now);

    // Accepts either a delay in seconds ("120") or an HTTP date
    // ("Wed, 21 Oct 2015 07:28:00 GMT").
    std::optional<QDateTime> parseRetryAfter(const QString& value, const QDateTime& now);

    ModelRequestId requestIdFromHeaders(const HttpHeaders& headers);
}
