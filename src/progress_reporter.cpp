#include "transferq/progress_reporter.hpp"

#include "transferq/transfer.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace transferq {

double estimateRemaining(std::uint64_t done, std::uint64_t total, double speed) noexcept {
    if (!(speed > 0.0)) {
        return std::numeric_limits<double>::infinity();
    }
    const std::uint64_t left = total > done ? total - done : 0;
    return static_cast<double>(left) / speed;
}

ProgressReporter::ProgressReporter(NotificationChannel& channel, std::chrono::milliseconds interval,
                                   double smoothing)
    : channel_(channel),
      interval_(std::max(interval, std::chrono::milliseconds{1})),
      smoothing_(std::clamp(smoothing, 0.01, 1.0)) {}

ProgressReporter::~ProgressReporter() { stop(); }

void ProgressReporter::start(Sampler sampler) {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    sampler_ = std::move(sampler);
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void ProgressReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        running_ = false;
    }
    run_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressReporter::run() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(run_mutex_);
            if (run_cv_.wait_for(lock, interval_, [this] { return !running_; })) {
                return;
            }
        }

        try {
            tick(sampler_(), clock::now());
        } catch (const std::exception& ex) {
            spdlog::error("Progress sampling failed: {}", ex.what());
        }
    }
}

void ProgressReporter::tick(const std::optional<ProgressSample>& sample, clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sample) {
        tracking_ = false;
        speed_ = 0.0;
        speed_seeded_ = false;
        return;
    }

    if (!tracking_ || sample->hash != hash_ || sample->generation != generation_) {
        // New activation: rebase on the current counters so bytes that were
        // already on disk do not show up as a speed spike.
        hash_ = sample->hash;
        generation_ = sample->generation;
        tracking_ = true;
        last_bytes_ = sample->bytes_done;
        last_time_ = now;
        speed_ = 0.0;
        speed_seeded_ = false;
        last_percent_ = -1.0;
        if (sample->bytes_total > 0) {
            emitProgressLocked(hash_, percentOf(sample->bytes_done, sample->bytes_total));
        }
        return;
    }

    if (sample->paused || !sample->transferring) {
        speed_ = 0.0;
        speed_seeded_ = false;
        last_bytes_ = sample->bytes_done;
        last_time_ = now;
        return;
    }

    const std::chrono::duration<double> elapsed = now - last_time_;
    if (elapsed.count() <= 0.0) {
        return;
    }

    const std::uint64_t delta = sample->bytes_done >= last_bytes_ ? sample->bytes_done - last_bytes_ : 0;
    const double instant = static_cast<double>(delta) / elapsed.count();
    speed_ = speed_seeded_ ? smoothing_ * instant + (1.0 - smoothing_) * speed_ : instant;
    speed_seeded_ = true;
    last_bytes_ = sample->bytes_done;
    last_time_ = now;

    if (sample->bytes_total > 0) {
        emitProgressLocked(hash_, percentOf(sample->bytes_done, sample->bytes_total));
    }
}

double ProgressReporter::speedFor(const std::string& hash, std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tracking_ || hash != hash_ || generation != generation_) {
        return 0.0;
    }
    return speed_;
}

void ProgressReporter::status(const std::string& hash, std::string text) {
    Event event;
    event.type = EventType::Status;
    event.hash = hash;
    event.text = std::move(text);
    channel_.publish(std::move(event));
}

void ProgressReporter::meta(const std::string& hash, std::string filename) {
    Event event;
    event.type = EventType::Meta;
    event.hash = hash;
    event.text = std::move(filename);
    channel_.publish(std::move(event));
}

void ProgressReporter::complete(const std::string& hash, std::string message) {
    Event event;
    event.type = EventType::Complete;
    event.hash = hash;
    event.text = std::move(message);
    channel_.publish(std::move(event));
}

void ProgressReporter::progress(const std::string& hash, std::uint64_t generation, double percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tracking_ && hash == hash_ && generation == generation_) {
        emitProgressLocked(hash, percent);
        return;
    }

    // Not sampled yet; the first tick rebases and re-emits the same value.
    Event event;
    event.type = EventType::Progress;
    event.hash = hash;
    event.percent = clampPercent(percent);
    channel_.publish(std::move(event));
}

void ProgressReporter::emitProgressLocked(const std::string& hash, double percent) {
    const double clamped = clampPercent(percent);
    // Never report a lower percentage for the same activation.
    if (clamped <= last_percent_) {
        return;
    }
    last_percent_ = clamped;

    Event event;
    event.type = EventType::Progress;
    event.hash = hash;
    event.percent = clamped;
    channel_.publish(std::move(event));
}

} // namespace transferq
