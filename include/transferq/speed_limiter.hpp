#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace transferq {

// Token bucket throttle. The bucket holds at most one second worth of
// tokens; a rate of 0 disables throttling.
class SpeedLimiter {
public:
    using clock = std::chrono::steady_clock;

    explicit SpeedLimiter(std::uint64_t bytes_per_second = 0);

    void setRate(std::uint64_t bytes_per_second);
    [[nodiscard]] std::uint64_t rate() const;

    // Takes `bytes` from the bucket and returns how long the caller has to
    // wait before the data is within the cap. Zero means go ahead.
    [[nodiscard]] clock::duration reserve(std::size_t bytes);
    [[nodiscard]] clock::duration reserve(std::size_t bytes, clock::time_point now);

private:
    void refill(clock::time_point now);

    mutable std::mutex mutex_;
    std::uint64_t rate_{0};
    double tokens_{0.0};
    clock::time_point last_refill_{};
};

} // namespace transferq
