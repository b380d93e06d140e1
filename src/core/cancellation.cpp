#include "cancellation.h"

CancellationToken::CancellationToken(QObject* parent)
    : QObject(parent)
{
}

void CancellationToken::cancel()
{
    if (m_cancelled.exchange(true, std::memory_order_acq_rel))
        return;
    emit cancellationRequested();
}
