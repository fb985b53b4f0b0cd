#pragma once

#include <chrono>

namespace savekeeper {

/**
 * DebounceTimer - deadline bookkeeping for one watch session
 *
 * Each qualifying event pushes the deadline to now + window. The owner
 * polls expired()/take_expired() from its event loop; nothing here sleeps
 * or spawns threads. Not thread-safe, the owning session guards it.
 */
class DebounceTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit DebounceTimer(std::chrono::milliseconds window) : window_(window) {}

    void reset(Clock::time_point now) {
        deadline_ = now + window_;
        armed_ = true;
    }

    void cancel() { armed_ = false; }

    bool armed() const { return armed_; }

    Clock::time_point deadline() const { return deadline_; }

    std::chrono::milliseconds window() const { return window_; }

    bool expired(Clock::time_point now) const { return armed_ && now >= deadline_; }

    // Disarms and returns true exactly once per expiry
    bool take_expired(Clock::time_point now) {
        if (!expired(now)) return false;
        armed_ = false;
        return true;
    }

    // Time left before expiry, zero when expired, max() when disarmed
    std::chrono::milliseconds remaining(Clock::time_point now) const {
        if (!armed_) return std::chrono::milliseconds::max();
        if (now >= deadline_) return std::chrono::milliseconds(0);
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
        // Round up so a poll with this timeout never wakes just before the deadline
        if (deadline_ - now > left) left += std::chrono::milliseconds(1);
        return left;
    }

private:
    std::chrono::milliseconds window_;
    Clock::time_point deadline_{};
    bool armed_ = false;
};

} // namespace savekeeper
