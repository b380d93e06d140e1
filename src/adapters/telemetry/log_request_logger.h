#pragma once
#include "chat/ports.h"

// IRequestLogger that writes one line when a request starts and one when it
// resolves, under the "request" log category.
class LogRequestLogger : public IRequestLogger {
public:
    std::unique_ptr<IPendingRequest> begin(const LoggedRequest& request) override;
};
