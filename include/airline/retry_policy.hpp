#pragma once

/**
 * @file retry_policy.hpp
 * @brief Bounded retry budget with jittered backoff for OCC loops.
 */

namespace airline {

/**
 * @brief How often an OCC loop may retry and how long it sleeps in between.
 *
 * @details
 * The sleep between two attempts is drawn uniformly from
 * [backoff_min_ms, backoff_max_ms]. The jitter de-correlates callers that
 * lost the same version race so they do not collide again on the next read.
 */
struct RetryPolicy {
    int max_attempts = 3;    /**< Total attempts, first one included. Always >= 1. */
    int backoff_min_ms = 1;  /**< Lower bound of the random sleep. */
    int backoff_max_ms = 50; /**< Upper bound of the random sleep. */
};

/**
 * @brief Sleeps the calling thread for a random delay chosen per @p policy.
 *
 * Uses a thread-local generator, so concurrent callers never share state.
 */
void backoff(const RetryPolicy& policy);

} // namespace airline
