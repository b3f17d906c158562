#pragma once

#include "events.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace transferq {

// Best-effort push fan-out. Every subscriber owns a bounded buffer; publish()
// never waits for a consumer. When a buffer is full the event is dropped for
// that subscriber, and one that keeps dropping is disconnected. Consumers
// resynchronise through the status endpoint.
class NotificationChannel {
    struct Listener;
    // Only the channel can name this, so only it can build a Subscription.
    struct SubscribeToken {
        explicit SubscribeToken() = default;
    };

public:
    class Subscription {
    public:
        Subscription(SubscribeToken, std::shared_ptr<Listener> listener);
        ~Subscription();

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        // Next buffered event, waiting up to `timeout`. nullopt on timeout or
        // once disconnected with nothing left to read.
        std::optional<Event> next(std::chrono::milliseconds timeout);
        std::vector<Event> drain();

        [[nodiscard]] bool connected() const;
        [[nodiscard]] std::uint64_t dropped() const;

    private:
        std::shared_ptr<Listener> listener_;
    };

    explicit NotificationChannel(std::size_t buffer_size = 64, std::size_t max_consecutive_drops = 256);

    [[nodiscard]] std::unique_ptr<Subscription> subscribe();
    void publish(Event event);

    [[nodiscard]] std::size_t listenerCount() const;

private:
    struct Listener {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Event> buffer;
        std::size_t capacity{0};
        std::size_t consecutive_drops{0};
        std::uint64_t dropped{0};
        bool connected{true};
    };

    std::size_t buffer_size_;
    std::size_t max_consecutive_drops_;

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Listener>> listeners_;
    std::uint64_t next_sequence_{1};
};

using SubscriptionPtr = std::unique_ptr<NotificationChannel::Subscription>;

} // namespace transferq
