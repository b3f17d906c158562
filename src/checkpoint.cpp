#include "transferq/checkpoint.hpp"

namespace transferq {

bool Checkpoint::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_ || stop_) {
        return false;
    }
    paused_ = true;
    return true;
}

bool Checkpoint::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) {
            return false;
        }
        paused_ = false;
    }
    cv_.notify_all();
    return true;
}

void Checkpoint::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

bool Checkpoint::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool Checkpoint::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

bool Checkpoint::pass() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || stop_; });
    return !stop_;
}

bool Checkpoint::sleepFor(std::chrono::steady_clock::duration duration) {
    using clock = std::chrono::steady_clock;

    std::unique_lock<std::mutex> lock(mutex_);
    auto remaining = duration;
    while (remaining > clock::duration::zero()) {
        cv_.wait(lock, [this] { return !paused_ || stop_; });
        if (stop_) {
            return false;
        }
        const auto started = clock::now();
        if (cv_.wait_for(lock, remaining, [this] { return paused_ || stop_; })) {
            if (stop_) {
                return false;
            }
        }
        remaining -= clock::now() - started;
    }
    return !stop_;
}

} // namespace transferq
