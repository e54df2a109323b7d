#include "retrypolicy.h"

#include <QRandomGenerator>
#include <QtGlobal>

int RetryPolicy::delayBeforeAttempt(int attempt) const
{
    if (attempt < 1)
        return 0;

    const int base = qBound(0, intervalMs, kMaxDelayMs);
    const int jitter = qBound(0, jitterMs, kMaxDelayMs);
    if (jitter == 0)
        return base;

    return base + static_cast<int>(QRandomGenerator::global()->bounded(jitter + 1));
}

RetryPolicy RetryPolicy::normalized() const
{
    RetryPolicy p;
    p.intervalMs = qBound(0, intervalMs, kMaxDelayMs);
    p.ceiling    = qBound(0, ceiling, kMaxCeiling);
    p.jitterMs   = qBound(0, jitterMs, kMaxDelayMs);
    return p;
}
