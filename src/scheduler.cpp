#include "transferq/scheduler.hpp"

#include "transferq/errors.hpp"
#include "transferq/fingerprint.hpp"

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferq {

namespace fs = std::filesystem;

namespace {

std::string displayName(const std::string& alias, const fs::path& artifact) {
    return alias.empty() ? artifact.filename().string() : alias;
}

void moveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec == std::errc::cross_device_link) {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        fs::remove(from);
        return;
    }
    if (ec) {
        throw fs::filesystem_error("move artifact", from, to, ec);
    }
}

} // namespace

Scheduler::Scheduler(Options options, FetcherPtr fetcher, ArchiverPtr archiver, QueueJournalPtr journal,
                     ArtifactCache& cache, SpeedLimiter& limiter, ProgressReporter& reporter)
    : options_(std::move(options)),
      fetcher_(std::move(fetcher)),
      archiver_(std::move(archiver)),
      journal_(std::move(journal)),
      cache_(cache),
      limiter_(limiter),
      reporter_(reporter) {
    if (!fetcher_) {
        throw std::invalid_argument("Scheduler requires a fetcher");
    }
    cache_.ensureRoot();
    if (journal_) {
        restoreQueue();
    }
}

Scheduler::~Scheduler() {
    shutdown();
}

std::string Scheduler::enqueue(const std::string& source, const std::string& alias) {
    if (source.empty()) {
        throw ValidationError("Source must not be empty");
    }
    reapRetired();

    const std::string resolved = alias.empty() ? aliasFromSource(source) : alias;
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = store_.enqueue(source, resolved);
    if (!result.inserted) {
        spdlog::debug("{} is already queued as {}", source, result.hash);
        return result.hash;
    }

    spdlog::info("Queued '{}' ({})", resolved, result.hash);
    promoteLocked();
    persistLocked();
    return result.hash;
}

void Scheduler::remove(const std::string& hash) {
    reapRetired();
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);
    if (job_ && job_->hash == hash) {
        cancelLocked(lock);
        promoteLocked();
        persistLocked();
        return;
    }

    const Transfer removed = store_.remove(hash);
    const std::size_t entries = cache_.removeFor(hash);
    spdlog::info("Removed '{}' from queue ({} cache entries deleted)", removed.alias, entries);
    persistLocked();
}

void Scheduler::reorder(const std::vector<std::string>& ordered_hashes) {
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    store_.reorder(ordered_hashes);
    spdlog::debug("Queue reordered ({} entries)", ordered_hashes.size());
    persistLocked();
}

void Scheduler::pause() {
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!job_ || !job_->checkpoint.pause()) {
        return;
    }
    if (Transfer* active = store_.active()) {
        active->status = TransferStatus::Paused;
    }
    spdlog::info("Paused {}", job_->hash);
    reporter_.status(job_->hash, "Paused");
}

void Scheduler::resume() {
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!job_ || !job_->checkpoint.resume()) {
        return;
    }
    if (Transfer* active = store_.active()) {
        active->status = TransferStatus::Active;
    }
    spdlog::info("Resumed {}", job_->hash);
    reporter_.status(job_->hash, "Resumed");
}

void Scheduler::cancel() {
    reapRetired();
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);
    if (!job_) {
        return;
    }
    cancelLocked(lock);
    promoteLocked();
    persistLocked();
}

void Scheduler::demoteActive(std::size_t position) {
    reapRetired();
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);
    if (!job_) {
        throw ValidationError("No active transfer to move back to the queue");
    }

    const std::string demoted = job_->hash;
    if (!stopActiveLocked(lock)) {
        promoteLocked();
        persistLocked();
        return;
    }
    store_.demoteActiveToQueue(position);
    reporter_.status(demoted, "Queued");
    spdlog::info("Moved {} back to queue position {}", demoted, position);

    const auto hashes = store_.queuedHashes();
    const auto next = std::find_if(hashes.begin(), hashes.end(),
                                   [&demoted](const std::string& h) { return h != demoted; });
    if (next != hashes.end()) {
        store_.moveToFront(*next);
    }
    promoteLocked();
    persistLocked();
}

void Scheduler::activate(const std::string& hash, std::size_t demote_position) {
    reapRetired();
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);
    if (job_ && job_->hash == hash) {
        return;
    }
    if (!store_.isQueued(hash)) {
        throw ValidationError(fmt::format("Unknown queued transfer: {}", hash));
    }

    if (job_) {
        const std::string previous = job_->hash;
        if (stopActiveLocked(lock)) {
            store_.demoteActiveToQueue(demote_position);
            reporter_.status(previous, "Queued");
            spdlog::info("Moved {} back to queue position {}", previous, demote_position);
        }
    }

    store_.moveToFront(hash);
    promoteLocked();
    persistLocked();
}

std::size_t Scheduler::cleanCache() {
    std::lock_guard<std::mutex> serial(command_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keep;
    if (job_) {
        keep.push_back(job_->hash);
    }
    const std::size_t removed = cache_.clean(keep);
    spdlog::info("Cache cleaned, {} entries removed", removed);
    return removed;
}

void Scheduler::shutdown() {
    {
        std::lock_guard<std::mutex> serial(command_mutex_);
        std::unique_lock<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            shutting_down_ = true;
            if (job_ && stopActiveLocked(lock)) {
                // Park the interrupted job at the head so the next start resumes it.
                store_.demoteActiveToQueue(0);
            }
            persistLocked();
        }
    }
    reapRetired();
}

StatusSnapshot Scheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatusSnapshot status;
    status.queue.reserve(store_.queue().size());
    for (const auto& transfer : store_.queue()) {
        status.queue.push_back({transfer.hash, transfer.alias});
    }

    const Transfer* active = store_.active();
    if (!active || !job_) {
        return status;
    }

    status.active = true;
    status.hash = active->hash;
    status.source = active->source;
    status.alias = active->alias;
    status.status = active->status;
    status.bytes_total = job_->bytes_total.load();
    status.bytes_done = job_->bytes_done.load();
    status.progress = percentOf(status.bytes_done, status.bytes_total);
    status.is_paused = job_->checkpoint.paused();
    status.is_processing = job_->phase.load() != Phase::Transferring;
    if (!status.is_paused && !status.is_processing) {
        status.speed = reporter_.speedFor(job_->hash, job_->generation);
    }
    status.remaining_time = estimateRemaining(status.bytes_done, status.bytes_total, status.speed);
    return status;
}

std::optional<ProgressSample> Scheduler::sample() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!job_) {
        return std::nullopt;
    }
    ProgressSample sample;
    sample.hash = job_->hash;
    sample.generation = job_->generation;
    sample.bytes_done = job_->bytes_done.load();
    sample.bytes_total = job_->bytes_total.load();
    sample.paused = job_->checkpoint.paused();
    sample.transferring = job_->phase.load() == Phase::Transferring;
    return sample;
}

std::size_t Scheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.activeCount();
}

void Scheduler::restoreQueue() {
    const auto saved = journal_->load();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t restored = 0;
    for (const auto& transfer : saved) {
        const auto result = store_.restore(transfer);
        if (!transfer.hash.empty() && transfer.hash != result.hash) {
            spdlog::warn("Saved entry '{}' had hash {}, now {}", transfer.alias, transfer.hash, result.hash);
        }
        restored += result.inserted ? 1 : 0;
    }
    if (restored == 0) {
        return;
    }
    spdlog::info("Restored {} saved transfers", restored);
    promoteLocked();
}

void Scheduler::persistLocked() {
    if (!journal_) {
        return;
    }
    std::vector<Transfer> transfers;
    transfers.reserve(store_.queue().size() + 1);
    if (const Transfer* active = store_.active()) {
        transfers.push_back(*active);
        if (job_ && job_->hash == active->hash) {
            transfers.back().bytes_done = job_->bytes_done.load();
        }
    }
    transfers.insert(transfers.end(), store_.queue().begin(), store_.queue().end());

    try {
        journal_->save(transfers);
    } catch (const std::exception& ex) {
        // The in-memory queue stays authoritative; the next mutation retries.
        spdlog::error("Failed to save the queue: {}", ex.what());
    }
}

void Scheduler::promoteLocked() {
    if (shutting_down_ || job_) {
        return;
    }
    auto next = store_.promoteNext();
    if (!next) {
        spdlog::debug("Queue empty, scheduler idle");
        return;
    }

    auto job = std::make_shared<Job>();
    job->generation = ++generation_;
    job->hash = next->hash;
    job->source = next->source;
    job->alias = next->alias;
    job->artifact = cache_.artifactFor(next->hash, extensionFromSource(next->source));
    job->bytes_done = next->bytes_done;
    job->bytes_total = next->bytes_total;
    job->stopped = job->acknowledged.get_future().share();

    retireWorkerLocked();
    job_ = job;
    spdlog::info("Starting '{}' ({})", job->alias, job->hash);
    reporter_.status(job->hash, "Downloading...");

    worker_ = std::thread([this, job] {
        job->outcome = runPipeline(*job);
        job->acknowledged.set_value();
        onWorkerFinished(job);
    });
}

void Scheduler::onWorkerFinished(const JobPtr& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A stopping command owns this job's outcome.
    if (job_ != job || job->stop_claimed || job->outcome.kind == Outcome::Kind::Stopped) {
        return;
    }
    finishLocked(job);
    promoteLocked();
    persistLocked();
}

void Scheduler::finishLocked(const JobPtr& job) {
    retireWorkerLocked();
    job_.reset();

    if (job->outcome.kind == Outcome::Kind::Completed) {
        store_.retireActive(TransferStatus::Completed);
        spdlog::info("Finished '{}' -> {}", job->alias, job->outcome.message);
        reporter_.status(job->hash, "Finished");
        reporter_.complete(job->hash, job->outcome.message);
        return;
    }

    store_.retireActive(TransferStatus::Failed);
    spdlog::error("Transfer '{}' failed: {}", job->alias, job->outcome.message);
    reporter_.status(job->hash, fmt::format("Failed: {}", job->outcome.message));
}

bool Scheduler::stopActiveLocked(std::unique_lock<std::mutex>& lock) {
    const JobPtr job = job_;
    job->stop_claimed = true;
    job->checkpoint.stop();

    // command_mutex_ keeps other commands out; readers only need mutex_.
    lock.unlock();
    job->stopped.wait();
    lock.lock();
    retireWorkerLocked();

    if (job->outcome.kind != Outcome::Kind::Stopped) {
        finishLocked(job);
        return false;
    }

    if (Transfer* active = store_.active()) {
        active->bytes_done = job->bytes_done.load();
        active->bytes_total = job->bytes_total.load();
    }
    job_.reset();
    return true;
}

void Scheduler::cancelLocked(std::unique_lock<std::mutex>& lock) {
    const JobPtr job = job_;
    if (!stopActiveLocked(lock)) {
        return;
    }

    // The worker has acknowledged the stop, nothing writes the artifact now.
    const std::size_t removed = cache_.removeFor(job->hash);
    store_.retireActive(TransferStatus::Cancelled);
    spdlog::info("Cancelled '{}' ({} cache entries deleted)", job->alias, removed);
    reporter_.status(job->hash, "Cancelled");
}

void Scheduler::retireWorkerLocked() {
    if (worker_.joinable()) {
        retired_.push_back(std::move(worker_));
    }
}

void Scheduler::reapRetired() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(retired_);
    }
    for (auto& thread : threads) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
            continue;
        }
        thread.join();
    }
}

Scheduler::Outcome Scheduler::runPipeline(Job& job) {
    Outcome outcome;
    try {
        const FetchInfo info =
            fetcher_->probe(job.source, [&job] { return !job.checkpoint.stopRequested(); });
        if (job.checkpoint.stopRequested()) {
            return outcome;
        }
        const std::uint64_t total = info.content_length;
        std::uint64_t offset = cache_.confirmedBytes(job.artifact);

        const bool stale = total > 0 && offset > total;
        const bool unresumable = offset > 0 && total > 0 && offset < total && !info.supports_range;
        if (stale || unresumable) {
            spdlog::warn("Discarding {} bytes of {} ({})", offset, job.artifact.filename().string(),
                         stale ? "larger than the source" : "source does not support ranges");
            std::error_code ec;
            fs::remove(job.artifact, ec);
            offset = 0;
        }

        job.bytes_total = total;
        job.bytes_done = offset;
        reporter_.meta(job.hash, displayName(job.alias, job.artifact));

        if (total > 0 && offset == total) {
            spdlog::info("Cache hit for {}", job.artifact.filename().string());
        } else {
            if (total > offset) {
                const auto available = cache_.availableSpace();
                if (available && *available < total - offset) {
                    throw CapacityError(fmt::format("Insufficient disk space: need {} bytes but only {} available",
                                                    total - offset, *available));
                }
            }
            if (!fetchWithRetry(job, info.supports_range)) {
                return outcome;
            }
        }

        reporter_.progress(job.hash, job.generation, 100.0);
        if (!job.checkpoint.pass()) {
            return outcome;
        }

        auto destination = finalize(job);
        if (!destination) {
            return outcome;
        }
        outcome.kind = Outcome::Kind::Completed;
        outcome.message = std::move(*destination);
    } catch (const TransferError& ex) {
        outcome.kind = Outcome::Kind::Failed;
        outcome.message = fmt::format("{} error: {}", toString(ex.kind()), ex.what());
    } catch (const fs::filesystem_error& ex) {
        outcome.kind = Outcome::Kind::Failed;
        outcome.message = ex.code() == std::errc::no_space_on_device
                              ? fmt::format("capacity error: {}", ex.what())
                              : fmt::format("filesystem error: {}", ex.what());
    } catch (const std::exception& ex) {
        outcome.kind = Outcome::Kind::Failed;
        outcome.message = ex.what();
    }
    return outcome;
}

bool Scheduler::fetchWithRetry(Job& job, bool resumable) {
    FetchCallbacks callbacks;
    callbacks.on_size = [&job](std::uint64_t total) {
        std::uint64_t unknown = 0;
        job.bytes_total.compare_exchange_strong(unknown, total);
    };
    callbacks.on_chunk = [this, &job](std::size_t written) {
        job.bytes_done += written;
        const auto wait = limiter_.reserve(written);
        if (wait > SpeedLimiter::clock::duration::zero() && !job.checkpoint.sleepFor(wait)) {
            return false;
        }
        return job.checkpoint.pass();
    };
    callbacks.keep_going = [&job] { return !job.checkpoint.stopRequested(); };

    int attempt = 0;
    for (;;) {
        if (!job.checkpoint.pass()) {
            return false;
        }

        FetchRequest request;
        request.source = job.source;
        request.artifact = job.artifact;
        request.offset = cache_.confirmedBytes(job.artifact);
        if (request.offset > 0 && !resumable) {
            // Offset 0 truncates the artifact.
            spdlog::debug("Restarting {} from byte 0, source does not support ranges", job.hash);
            request.offset = 0;
        }
        job.bytes_done = request.offset;

        try {
            if (fetcher_->fetch(request, callbacks) == FetchOutcome::Stopped) {
                return false;
            }

            const std::uint64_t confirmed = cache_.confirmedBytes(job.artifact);
            const std::uint64_t total = job.bytes_total.load();
            if (total > 0 && confirmed < total) {
                throw TransportError(fmt::format("Transfer ended at {} of {} bytes", confirmed, total));
            }
            if (total == 0) {
                job.bytes_total = confirmed;
            }
            job.bytes_done = confirmed;
            return true;
        } catch (const TransportError& ex) {
            if (!ex.retryable() || attempt >= options_.max_retries) {
                throw;
            }
            ++attempt;
            const auto delay = options_.retry_base_delay * (1LL << (attempt - 1));
            spdlog::warn("Transfer {} failed ({}), retry {}/{} in {} ms", job.hash, ex.what(), attempt,
                         options_.max_retries, delay.count());
            reporter_.status(job.hash, fmt::format("Retrying ({}/{})...", attempt, options_.max_retries));
            if (!job.checkpoint.sleepFor(delay)) {
                return false;
            }
        }
    }
}

std::optional<std::string> Scheduler::finalize(Job& job) {
    fs::create_directories(options_.download_dir);

    if (archiver_ && archiver_->recognizes(job.artifact)) {
        job.phase = Phase::Extracting;
        reporter_.status(job.hash, "Extracting...");

        const fs::path destination = options_.download_dir / job.hash;
        fs::remove_all(destination);
        // Archive errors propagate and leave the artifact in the cache.
        if (!archiver_->extract(job.artifact, destination, [&job] { return job.checkpoint.pass(); })) {
            return std::nullopt;
        }
        cache_.removeFor(job.hash);
        return destination.string();
    }

    job.phase = Phase::Finalizing;
    reporter_.status(job.hash, "Finalizing...");
    const fs::path destination = options_.download_dir / job.artifact.filename();
    moveFile(job.artifact, destination);
    return destination.string();
}

} // namespace transferq
