#include "transferq/transfer_manager.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace transferq {

namespace {

Scheduler::Options schedulerOptions(const ManagerConfig& config) {
    Scheduler::Options options;
    options.download_dir = config.download_dir;
    options.max_retries = config.max_retries;
    options.retry_base_delay = config.retry_base_delay;
    return options;
}

} // namespace

TransferManager::TransferManager(const ManagerConfig& config, FetcherPtr fetcher, ArchiverPtr archiver,
                                 QueueJournalPtr journal)
    : channel_(config.listener_buffer, config.listener_max_drops),
      limiter_(config.speed_limit_kib * 1024),
      cache_(config.cache_dir),
      reporter_(channel_, config.sample_interval, config.speed_smoothing),
      scheduler_(schedulerOptions(config), std::move(fetcher), std::move(archiver), std::move(journal), cache_,
                 limiter_, reporter_),
      endpoint_(scheduler_) {
    reporter_.start([this] { return scheduler_.sample(); });
    spdlog::debug("Transfer manager ready (cache {}, downloads {})", config.cache_dir.string(),
                  config.download_dir.string());
}

TransferManager::~TransferManager() {
    reporter_.stop();
    scheduler_.shutdown();
}

std::string TransferManager::enqueue(const std::string& url, const std::string& alias) {
    return scheduler_.enqueue(url, alias);
}

StatusSnapshot TransferManager::getStatus() const {
    return endpoint_.getStatus();
}

void TransferManager::pause() { scheduler_.pause(); }

void TransferManager::resume() { scheduler_.resume(); }

void TransferManager::cancel() { scheduler_.cancel(); }

void TransferManager::reorderQueue(const std::vector<std::string>& hashes) {
    scheduler_.reorder(hashes);
}

void TransferManager::removeFromQueue(const std::string& hash) {
    scheduler_.remove(hash);
}

void TransferManager::demoteActive(std::size_t position) {
    scheduler_.demoteActive(position);
}

void TransferManager::activate(const std::string& hash, std::size_t demote_position) {
    scheduler_.activate(hash, demote_position);
}

std::size_t TransferManager::cleanCache() {
    return scheduler_.cleanCache();
}

void TransferManager::setSpeedLimit(std::uint64_t kib_per_second) {
    limiter_.setRate(kib_per_second * 1024);
    spdlog::info("Speed limit set to {}", kib_per_second == 0 ? std::string("unlimited")
                                                               : std::to_string(kib_per_second) + " KiB/s");
}

std::size_t TransferManager::activeCount() const {
    return scheduler_.activeCount();
}

SubscriptionPtr TransferManager::subscribe() {
    return channel_.subscribe();
}

} // namespace transferq
