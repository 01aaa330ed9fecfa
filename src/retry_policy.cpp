#include "airline/retry_policy.hpp"

#include <chrono>
#include <random>
#include <thread>

namespace airline {

void backoff(const RetryPolicy& policy) {
    if (policy.backoff_max_ms <= 0) return;

    thread_local std::mt19937 rng{std::random_device{}()};
    const int lo = policy.backoff_min_ms < 0 ? 0 : policy.backoff_min_ms;
    const int hi = policy.backoff_max_ms < lo ? lo : policy.backoff_max_ms;
    std::uniform_int_distribution<int> dist(lo, hi);

    std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng)));
}

} // namespace airline
