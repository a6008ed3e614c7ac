#pragma once

#include <chrono>
#include <random>

namespace edgesync {

/// Exponential retry schedule
struct BackoffPolicy {
    std::chrono::milliseconds base{5000};
    double factor = 2.0;
    std::chrono::milliseconds cap{600000};
    double jitter = 0.0;   // +/- fraction applied by apply_jitter, 0 disables
};

/// Delay before retry number attempt (1-based): min(base * factor^(attempt-1), cap)
std::chrono::milliseconds backoff_delay(int attempt, const BackoffPolicy& policy);

/// Spread delay uniformly over [delay * (1 - jitter), delay * (1 + jitter)],
/// never exceeding the cap
std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay,
                                       const BackoffPolicy& policy,
                                       std::mt19937_64& rng);

}  // namespace edgesync
