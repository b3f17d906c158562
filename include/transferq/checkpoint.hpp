#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace transferq {

// Cooperative pause/stop gate shared between the scheduler and the worker
// running the active transfer. Requests take effect when the worker next
// calls pass() or sleepFor().
class Checkpoint {
public:
    // Returns false when already paused or stopping.
    bool pause();
    // Returns false when not paused.
    bool resume();
    void stop();

    [[nodiscard]] bool paused() const;
    [[nodiscard]] bool stopRequested() const;

    // Blocks while paused. Returns false once a stop was requested.
    bool pass();

    // Waits for `duration` of unpaused time, waking early on stop.
    // Returns false if a stop was requested.
    bool sleepFor(std::chrono::steady_clock::duration duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_{false};
    bool stop_{false};
};

} // namespace transferq
