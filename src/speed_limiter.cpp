#include "transferq/speed_limiter.hpp"

#include <algorithm>

namespace transferq {

SpeedLimiter::SpeedLimiter(std::uint64_t bytes_per_second)
    : rate_(bytes_per_second),
      tokens_(static_cast<double>(bytes_per_second)),
      last_refill_(clock::now()) {}

void SpeedLimiter::setRate(std::uint64_t bytes_per_second) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rate_ == bytes_per_second) {
        return;
    }
    rate_ = bytes_per_second;
    tokens_ = static_cast<double>(bytes_per_second);
    last_refill_ = clock::now();
}

std::uint64_t SpeedLimiter::rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rate_;
}

SpeedLimiter::clock::duration SpeedLimiter::reserve(std::size_t bytes) {
    return reserve(bytes, clock::now());
}

SpeedLimiter::clock::duration SpeedLimiter::reserve(std::size_t bytes, clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rate_ == 0) {
        return clock::duration::zero();
    }

    refill(now);
    tokens_ -= static_cast<double>(bytes);
    if (tokens_ >= 0.0) {
        return clock::duration::zero();
    }

    const std::chrono::duration<double> debt{-tokens_ / static_cast<double>(rate_)};
    return std::chrono::duration_cast<clock::duration>(debt);
}

void SpeedLimiter::refill(clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    const std::chrono::duration<double> elapsed = now - last_refill_;
    const double capacity = static_cast<double>(rate_);
    tokens_ = std::min(capacity, tokens_ + elapsed.count() * capacity);
    last_refill_ = now;
}

} // namespace transferq
