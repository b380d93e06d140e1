#include "retry_coordinator.h"
#include "core/cancellation.h"
#include "core/log_manager.h"

RetryCoordinator::RetryCoordinator(Invoke invoke)
    : m_invoke(std::move(invoke))
{
}

bool RetryCoordinator::networkChangedRetrySupported()
{
#if defined(Q_OS_LINUX) || defined(Q_OS_MACOS)
    return true;
#else
    return false;
#endif
}

QString RetryCoordinator::filterRetryMessage(FilterCategory category, const QString& filteredContent)
{
    if (category == FilterCategory::Copyright) {
        return QStringLiteral(
                   "The previous response (copied below) was filtered due to being too similar "
                   "to existing public code. Please suggest something similar in function that "
                   "does not match public code. Here's the previous response: %1\n\n")
            .arg(filteredContent);
    }
    return QStringLiteral(
               "The previous response (copied below) was filtered due to triggering our content "
               "safety filters, which looks for hateful, self-harm, sexual, or violent content. "
               "Please suggest something similar in content that does not trigger these filters. "
               "Here's the previous response: %1\n\n")
        .arg(filteredContent);
}

ChatResponse RetryCoordinator::toTerminalFiltered(const ChatResponse& filtered)
{
    ChatResponse out;
    out.type = ChatResponseType::Filtered;
    out.category = filtered.category;
    out.reason = QStringLiteral("Response got filtered.");
    out.requestId = filtered.requestId;
    out.serverRequestId = filtered.serverRequestId;
    return out;
}

RetryDecision RetryCoordinator::shouldRetryFilter(const FetchOptions& options,
                                                  const ChatResponse& filtered) const
{
    if (filtered.type != ChatResponseType::FilteredRetry)
        return {false, QStringLiteral("not a filtered response")};
    if (!options.enableRetryOnFilter)
        return {false, QStringLiteral("filter retry disabled")};
    return {true, QStringLiteral("retry after %1 filter")
                      .arg(filterCategoryName(filtered.category.value_or(FilterCategory::Copyright)))};
}

RetryDecision RetryCoordinator::shouldRetryNetworkChange(const FetchOptions& options,
                                                         const ChatResponse& processed,
                                                         const TransportError& cause) const
{
    if (!networkChangedRetrySupported())
        return {false, QStringLiteral("platform does not report network changes")};
    if (processed.type != ChatResponseType::NetworkError)
        return {false, QStringLiteral("not a network error")};
    if (cause.kind != TransportErrorKind::NetworkChanged)
        return {false, QStringLiteral("network error is not a network change")};
    if (!options.retryOnErrorEnabled())
        return {false, QStringLiteral("error retry disabled")};
    return {true, QStringLiteral("network changed during request")};
}

ChatResponse RetryCoordinator::retryAfterFilter(const FetchOptions& options,
                                                const ChatResponse& filtered,
                                                const FinishedCallback& notify,
                                                const CancellationToken& token) const
{
    const FilterCategory category = filtered.category.value_or(FilterCategory::Copyright);
    const QString categoryName = filterCategoryName(category);

    if (notify) {
        ResponseDelta marker;
        marker.retryReason = categoryName;
        notify(QString(), 0, marker);
    }

    const QString filteredContent = filtered.value.isEmpty() ? QString() : filtered.value.first();
    if (filteredContent.isEmpty()) {
        LOG_CAT_INFO(QStringLiteral("retry"),
                     QStringLiteral("Filtered response %1 has no content to quote, not retrying")
                         .arg(filtered.requestId));
        return toTerminalFiltered(filtered);
    }

    FetchOptions retry = options;
    retry.debugName = QStringLiteral("retry-") + options.debugName;
    retry.messages.append(ChatMessage::user(filterRetryMessage(category, filteredContent)));
    retry.userInitiatedRequest = false;
    retry.enableRetryOnFilter = false;
    retry.enableRetryOnError = options.retryOnErrorEnabled();
    retry.telemetryProperties[QStringLiteral("retryAfterFilterCategory")] = categoryName;

    LOG_CAT_INFO(QStringLiteral("retry"),
                 QStringLiteral("Retrying request %1 after %2 filter")
                     .arg(filtered.requestId, categoryName));

    ChatResponse result = m_invoke(retry, token);
    if (result.type == ChatResponseType::Success)
        return result;

    LOG_CAT_INFO(QStringLiteral("retry"),
                 QStringLiteral("Filter retry for %1 ended as %2, reporting original filter")
                     .arg(filtered.requestId, chatResponseTypeName(result.type)));
    return toTerminalFiltered(filtered);
}

ChatResponse RetryCoordinator::retryAfterNetworkChange(const FetchOptions& options,
                                                       const FinishedCallback& notify,
                                                       const CancellationToken& token) const
{
    if (notify) {
        ResponseDelta marker;
        marker.retryReason = QStringLiteral("network_error");
        notify(QString(), 0, marker);
    }

    FetchOptions retry = options;
    retry.debugName = QStringLiteral("retry-error-") + options.debugName;
    retry.userInitiatedRequest = false;
    retry.enableRetryOnError = false;
    retry.transport = TransportHint::Alternate;
    retry.telemetryProperties[QStringLiteral("retryAfterErrorCategory")] =
        QString::fromLatin1(kNetworkChangedCategory);

    LOG_CAT_INFO(QStringLiteral("retry"),
                 QStringLiteral("Retrying chat request over the alternate transport after a network change."));

    return m_invoke(retry, token);
}
