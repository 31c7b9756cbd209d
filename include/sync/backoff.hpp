#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace shiplog {

/**
 * @brief Doubling retry delay between a floor and a cap.
 *
 * After K consecutive failures current() == min(floor * 2^K, cap);
 * reset() returns it to the floor.
 */
class ExponentialBackoff {
public:
    using Duration = std::chrono::milliseconds;

    ExponentialBackoff(Duration floor, Duration cap)
        : floor_(floor), cap_(std::max(cap, floor)), current_(floor) {}

    /// Record a failure and return the delay to wait before retrying
    Duration on_failure() {
        ++consecutive_failures_;
        current_ = std::min(current_ * 2, cap_);
        return current_;
    }

    void reset() {
        current_ = floor_;
        consecutive_failures_ = 0;
    }

    [[nodiscard]] Duration current() const { return current_; }
    [[nodiscard]] Duration floor() const { return floor_; }
    [[nodiscard]] Duration cap() const { return cap_; }
    [[nodiscard]] uint32_t consecutive_failures() const { return consecutive_failures_; }

private:
    Duration floor_;
    Duration cap_;
    Duration current_;
    uint32_t consecutive_failures_ = 0;
};

} // namespace shiplog
