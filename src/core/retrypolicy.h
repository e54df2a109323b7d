#pragma once
/**
 * @file retrypolicy.h
 * @brief Fixed-interval retry policy with an attempt ceiling and optional jitter.
 */

/**
 * @brief Spacing and bound for repeated probes.
 *
 * One initial attempt plus @c ceiling retries, each preceded by
 * @c intervalMs (plus up to @c jitterMs of random extra delay).
 */
struct RetryPolicy
{
    static constexpr int kMaxDelayMs = 3600 * 1000;
    static constexpr int kMaxCeiling = 1000000;

    int intervalMs = 1000;
    int ceiling = 30;
    int jitterMs = 0;

    int maxAttempts() const { return ceiling + 1; }

    bool exhausted(int attemptsMade) const { return attemptsMade >= maxAttempts(); }

    /**
     * @brief Delay to wait before attempt number @p attempt (1-based).
     */
    int delayBeforeAttempt(int attempt) const;

    /**
     * @brief Clamp every field into [0, kMaxDelayMs] / [0, kMaxCeiling].
     */
    RetryPolicy normalized() const;
};
