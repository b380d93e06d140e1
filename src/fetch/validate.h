#pragma once
#include "chat/message.h"
#include "chat/ports.h"
#include "chat/request.h"

namespace Validate {
    constexpr int kDefaultHardToolLimit = 128;

    ValidationResult chatPayload(const QList<ChatMessage>& messages,
                                 const RequestOptions& options,
                                 int hardToolLimit = kDefaultHardToolLimit);

    bool isValidFunctionName(const QString& name);
}
