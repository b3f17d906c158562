#pragma once

#include "archiver.hpp"
#include "artifact_cache.hpp"
#include "checkpoint.hpp"
#include "fetcher.hpp"
#include "progress_reporter.hpp"
#include "queue_journal.hpp"
#include "queue_store.hpp"
#include "speed_limiter.hpp"
#include "status.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace transferq {

// Sole owner and mutator of the QueueStore. Commands are serialized on
// command_mutex_, so transitions never interleave. The active transfer's
// fetch/extract pipeline runs on a single worker thread supervised from here.
//
// Commands that stop the worker (cancel, remove, demote, activate, shutdown)
// wait for it to acknowledge before touching its artifact or promoting the
// next job. That wait releases mutex_, so snapshot() and sample() still answer
// while a stop is pending.
//
// With a journal, the queue is saved after every mutation and reloaded (and
// resumed) on construction.
class Scheduler {
public:
    struct Options {
        std::filesystem::path download_dir{"Downloads"};
        int max_retries{3};
        std::chrono::milliseconds retry_base_delay{1000};
    };

    Scheduler(Options options, FetcherPtr fetcher, ArchiverPtr archiver, QueueJournalPtr journal,
              ArtifactCache& cache, SpeedLimiter& limiter, ProgressReporter& reporter);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Empty alias derives one from the source. Returns the transfer hash;
    // duplicates return the existing hash.
    std::string enqueue(const std::string& source, const std::string& alias);

    // Queued: drop the entry and its cached artifacts. Active: same as cancel().
    void remove(const std::string& hash);
    void reorder(const std::vector<std::string>& ordered_hashes);

    // No-ops when nothing is active or already in the requested state.
    void pause();
    void resume();
    void cancel();

    // Sends the running job back to the queue at `position` and promotes the
    // first other queued job (or the same one when it is alone).
    void demoteActive(std::size_t position);
    // Puts a queued job on the Active slot; the running job, if any, goes back
    // to the queue at `demote_position` first.
    void activate(const std::string& hash, std::size_t demote_position = 0);

    // Deletes cache entries not owned by the active job. Returns the count.
    std::size_t cleanCache();

    // Stops the worker without deleting anything and refuses further promotion.
    void shutdown();

    [[nodiscard]] StatusSnapshot snapshot() const;
    [[nodiscard]] std::optional<ProgressSample> sample() const;
    [[nodiscard]] std::size_t activeCount() const;

private:
    enum class Phase {
        Transferring,
        Extracting,
        Finalizing
    };

    struct Outcome {
        enum class Kind { Completed, Failed, Stopped } kind{Kind::Stopped};
        std::string message;
    };

    struct Job {
        std::uint64_t generation{0};
        std::string hash;
        std::string source;
        std::string alias;
        std::filesystem::path artifact;
        Checkpoint checkpoint;
        std::atomic<std::uint64_t> bytes_done{0};
        std::atomic<std::uint64_t> bytes_total{0};
        std::atomic<Phase> phase{Phase::Transferring};
        Outcome outcome;
        // Set under mutex_ by the command that stops this job; the worker then
        // leaves the outcome to that command.
        bool stop_claimed{false};
        std::promise<void> acknowledged;
        std::shared_future<void> stopped;
    };

    using JobPtr = std::shared_ptr<Job>;

    Outcome runPipeline(Job& job);
    // False when stopped through the checkpoint. Without range support every
    // attempt restarts from byte 0.
    bool fetchWithRetry(Job& job, bool resumable);
    // Destination path, or nullopt when stopped mid-extraction.
    std::optional<std::string> finalize(Job& job);
    void onWorkerFinished(const JobPtr& job);

    void promoteLocked();
    void finishLocked(const JobPtr& job);
    // Returns true when the worker stopped on request, false when it had
    // already finished on its own (its outcome is then applied). `lock` holds
    // mutex_ on entry and exit but is released while waiting for the worker.
    bool stopActiveLocked(std::unique_lock<std::mutex>& lock);
    void cancelLocked(std::unique_lock<std::mutex>& lock);
    void restoreQueue();
    void persistLocked();
    void retireWorkerLocked();
    void reapRetired();

    Options options_;
    FetcherPtr fetcher_;
    ArchiverPtr archiver_;
    QueueJournalPtr journal_;
    ArtifactCache& cache_;
    SpeedLimiter& limiter_;
    ProgressReporter& reporter_;

    std::mutex command_mutex_;
    mutable std::mutex mutex_;
    QueueStore store_;
    JobPtr job_;
    std::thread worker_;
    std::vector<std::thread> retired_;
    std::uint64_t generation_{0};
    bool shutting_down_{false};
};

} // namespace transferq
