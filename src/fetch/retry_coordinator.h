#pragma once
#include "fetch_options.h"
#include "chat/failure.h"
#include "chat/response.h"
#include <functional>

class CancellationToken;

struct RetryDecision {
    bool retry = false;
    QString reason;
};

// Owns the two self-retry paths of a fetch. Each nested attempt is launched
// with its own trigger switched off, so a top-level call retries at most once
// per trigger.
class RetryCoordinator {
public:
    using Invoke = std::function<ChatResponse(const FetchOptions&, const CancellationToken&)>;

    explicit RetryCoordinator(Invoke invoke);

    RetryDecision shouldRetryFilter(const FetchOptions& options, const ChatResponse& filtered) const;
    RetryDecision shouldRetryNetworkChange(const FetchOptions& options,
                                           const ChatResponse& processed,
                                           const TransportError& cause) const;

    // Tells the caller a retry is under way, then appends a corrective user
    // message quoting the filtered text and fetches again. Resolves to the
    // retry's Success, or to a terminal Filtered built from `filtered`. With
    // nothing to quote no request is made.
    ChatResponse retryAfterFilter(const FetchOptions& options,
                                  const ChatResponse& filtered,
                                  const FinishedCallback& notify,
                                  const CancellationToken& token) const;

    // Fetches again over the alternate transport and returns whatever that
    // attempt resolves to.
    ChatResponse retryAfterNetworkChange(const FetchOptions& options,
                                         const FinishedCallback& notify,
                                         const CancellationToken& token) const;

    static ChatResponse toTerminalFiltered(const ChatResponse& filtered);
    static QString filterRetryMessage(FilterCategory category, const QString& filteredContent);
    static bool networkChangedRetrySupported();

    static constexpr const char* kNetworkChangedCategory = "network-changed";

private:
    Invoke m_invoke;
};
