#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace edgesync {

/// Wall-clock source, injected so retry timing can be tested without sleeping
class Clock {
public:
    virtual ~Clock() = default;

    /// Milliseconds since the Unix epoch
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/// Clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

    int64_t now_ms() const override { return now_.load(); }

    void advance(std::chrono::milliseconds delta) { now_ += delta.count(); }
    void set(int64_t ms) { now_ = ms; }

private:
    std::atomic<int64_t> now_;
};

}  // namespace edgesync
