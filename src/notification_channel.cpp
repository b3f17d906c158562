#include "transferq/notification_channel.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace transferq {

const char* toString(EventType type) noexcept {
    switch (type) {
    case EventType::Status:
        return "status";
    case EventType::Progress:
        return "progress";
    case EventType::Meta:
        return "meta";
    case EventType::Complete:
        return "complete";
    }
    return "unknown";
}

NotificationChannel::Subscription::Subscription(SubscribeToken, std::shared_ptr<Listener> listener)
    : listener_(std::move(listener)) {}

NotificationChannel::Subscription::~Subscription() {
    {
        std::lock_guard<std::mutex> lock(listener_->mutex);
        listener_->connected = false;
        listener_->buffer.clear();
    }
    listener_->cv.notify_all();
}

std::optional<Event> NotificationChannel::Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(listener_->mutex);
    listener_->cv.wait_for(lock, timeout, [this] {
        return !listener_->buffer.empty() || !listener_->connected;
    });
    if (listener_->buffer.empty()) {
        return std::nullopt;
    }
    Event event = std::move(listener_->buffer.front());
    listener_->buffer.pop_front();
    return event;
}

std::vector<Event> NotificationChannel::Subscription::drain() {
    std::lock_guard<std::mutex> lock(listener_->mutex);
    std::vector<Event> events(std::make_move_iterator(listener_->buffer.begin()),
                              std::make_move_iterator(listener_->buffer.end()));
    listener_->buffer.clear();
    return events;
}

bool NotificationChannel::Subscription::connected() const {
    std::lock_guard<std::mutex> lock(listener_->mutex);
    return listener_->connected;
}

std::uint64_t NotificationChannel::Subscription::dropped() const {
    std::lock_guard<std::mutex> lock(listener_->mutex);
    return listener_->dropped;
}

NotificationChannel::NotificationChannel(std::size_t buffer_size, std::size_t max_consecutive_drops)
    : buffer_size_(std::max<std::size_t>(1, buffer_size)),
      max_consecutive_drops_(std::max<std::size_t>(1, max_consecutive_drops)) {}

std::unique_ptr<NotificationChannel::Subscription> NotificationChannel::subscribe() {
    auto listener = std::make_shared<Listener>();
    listener->capacity = buffer_size_;

    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
    return std::make_unique<Subscription>(SubscribeToken{}, std::move(listener));
}

void NotificationChannel::publish(Event event) {
    std::vector<std::shared_ptr<Listener>> targets;
    bool prune = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.sequence = next_sequence_++;
        targets.reserve(listeners_.size());
        for (const auto& weak : listeners_) {
            if (auto listener = weak.lock()) {
                targets.push_back(std::move(listener));
            } else {
                prune = true;
            }
        }
    }

    for (const auto& listener : targets) {
        bool delivered = false;
        {
            std::lock_guard<std::mutex> lock(listener->mutex);
            if (!listener->connected) {
                prune = true;
                continue;
            }
            if (listener->buffer.size() < listener->capacity) {
                listener->buffer.push_back(event);
                listener->consecutive_drops = 0;
                delivered = true;
            } else {
                ++listener->dropped;
                if (++listener->consecutive_drops >= max_consecutive_drops_) {
                    listener->connected = false;
                    prune = true;
                    spdlog::warn("Disconnecting slow listener after {} dropped events", listener->dropped);
                }
            }
        }
        if (delivered) {
            listener->cv.notify_one();
        } else {
            listener->cv.notify_all();
        }
    }

    if (prune) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                        [](const std::weak_ptr<Listener>& weak) {
                                            auto listener = weak.lock();
                                            if (!listener) {
                                                return true;
                                            }
                                            std::lock_guard<std::mutex> guard(listener->mutex);
                                            return !listener->connected;
                                        }),
                         listeners_.end());
    }
}

std::size_t NotificationChannel::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(),
                                                  [](const std::weak_ptr<Listener>& weak) {
                                                      auto listener = weak.lock();
                                                      if (!listener) {
                                                          return false;
                                                      }
                                                      std::lock_guard<std::mutex> guard(listener->mutex);
                                                      return listener->connected;
                                                  }));
}

} // namespace transferq
