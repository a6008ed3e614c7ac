#include "backoff.hpp"

#include <algorithm>
#include <cmath>

namespace edgesync {

std::chrono::milliseconds backoff_delay(int attempt, const BackoffPolicy& policy) {
    if (attempt < 1) {
        attempt = 1;
    }
    double cap = static_cast<double>(policy.cap.count());
    double delay = static_cast<double>(policy.base.count()) *
                   std::pow(policy.factor, static_cast<double>(attempt - 1));
    if (!std::isfinite(delay) || delay > cap) {
        delay = cap;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay,
                                       const BackoffPolicy& policy,
                                       std::mt19937_64& rng) {
    if (policy.jitter <= 0.0) {
        return delay;
    }
    double spread = std::min(policy.jitter, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - spread, 1.0 + spread);
    auto jittered = static_cast<int64_t>(static_cast<double>(delay.count()) * dist(rng));
    return std::chrono::milliseconds(std::clamp<int64_t>(jittered, 0, policy.cap.count()));
}

}  // namespace edgesync
