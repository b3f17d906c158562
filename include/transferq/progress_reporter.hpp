#pragma once

#include "notification_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace transferq {

// What the reporter needs to know about the active transfer on each tick.
struct ProgressSample {
    std::string hash;
    std::uint64_t generation{0}; // distinguishes re-activations of the same hash
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
    bool paused{false};
    bool transferring{true}; // false while extracting/finalizing
};

// Seconds left at `speed` bytes/sec; +infinity when speed is not positive.
[[nodiscard]] double estimateRemaining(std::uint64_t done, std::uint64_t total, double speed) noexcept;

// Samples the active transfer on a fixed interval, keeps an exponentially
// smoothed speed and emits progress events. Coarse status, meta and
// completion events are forwarded from the scheduler.
class ProgressReporter {
public:
    using clock = std::chrono::steady_clock;
    using Sampler = std::function<std::optional<ProgressSample>()>;

    ProgressReporter(NotificationChannel& channel, std::chrono::milliseconds interval, double smoothing);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void start(Sampler sampler);
    void stop();

    // One sampling step. The sampler thread calls this; tests drive it directly.
    void tick(const std::optional<ProgressSample>& sample, clock::time_point now);

    // Smoothed speed for the given activation, 0 if it is not the one tracked.
    [[nodiscard]] double speedFor(const std::string& hash, std::uint64_t generation) const;

    void status(const std::string& hash, std::string text);
    void meta(const std::string& hash, std::string filename);
    void complete(const std::string& hash, std::string message);
    // Explicit progress, e.g. 100 once transport finished between ticks.
    void progress(const std::string& hash, std::uint64_t generation, double percent);

private:
    void run();
    void emitProgressLocked(const std::string& hash, double percent);

    NotificationChannel& channel_;
    std::chrono::milliseconds interval_;
    double smoothing_;

    mutable std::mutex mutex_;
    std::string hash_;
    std::uint64_t generation_{0};
    bool tracking_{false};
    std::uint64_t last_bytes_{0};
    clock::time_point last_time_{};
    double speed_{0.0};
    bool speed_seeded_{false};
    double last_percent_{-1.0};

    Sampler sampler_;
    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_{false};
    std::thread thread_;
};

} // namespace transferq
