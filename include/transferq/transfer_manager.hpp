#pragma once

#include "archiver.hpp"
#include "artifact_cache.hpp"
#include "config.hpp"
#include "fetcher.hpp"
#include "notification_channel.hpp"
#include "progress_reporter.hpp"
#include "queue_journal.hpp"
#include "scheduler.hpp"
#include "speed_limiter.hpp"
#include "status.hpp"
#include "status_endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transferq {

// Wires the queue manager together and exposes its request/response surface.
// Commands throw ValidationError for malformed input; everything else about a
// transfer is reported through status and events.
class TransferManager {
public:
    // A null journal keeps the queue in memory only.
    TransferManager(const ManagerConfig& config, FetcherPtr fetcher, ArchiverPtr archiver,
                    QueueJournalPtr journal = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    std::string enqueue(const std::string& url, const std::string& alias = {});
    [[nodiscard]] StatusSnapshot getStatus() const;

    void pause();
    void resume();
    void cancel();

    void reorderQueue(const std::vector<std::string>& hashes);
    void removeFromQueue(const std::string& hash);
    void demoteActive(std::size_t position);
    void activate(const std::string& hash, std::size_t demote_position = 0);

    std::size_t cleanCache();
    void setSpeedLimit(std::uint64_t kib_per_second);

    // Transfers occupying the Active slot, 0 or 1.
    [[nodiscard]] std::size_t activeCount() const;

    [[nodiscard]] SubscriptionPtr subscribe();

private:
    NotificationChannel channel_;
    SpeedLimiter limiter_;
    ArtifactCache cache_;
    ProgressReporter reporter_;
    Scheduler scheduler_;
    StatusEndpoint endpoint_;
};

} // namespace transferq
