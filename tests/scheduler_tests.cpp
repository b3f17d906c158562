// End-to-end queue behaviour through TransferManager with scripted fakes.
#include "test_support.hpp"

#include "transferq/config.hpp"
#include "transferq/errors.hpp"
#include "transferq/fingerprint.hpp"
#include "transferq/transfer_manager.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using transferq_test::FakeArchiver;
using transferq_test::FakeFetcher;
using transferq_test::MemoryJournal;
using transferq_test::TempDir;
using transferq_test::TestContext;
using transferq_test::readFile;
using transferq_test::waitFor;
using transferq_test::writeFile;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

const std::string kX = "https://files.test/x.bin";
const std::string kY = "https://files.test/y.bin";
const std::string kZ = "https://files.test/z.bin";

std::string payload(std::size_t size, char seed = 'a') {
    std::string data;
    data.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        data.push_back(static_cast<char>(seed + static_cast<char>(i % 26)));
    }
    return data;
}

FakeFetcher::Script script(std::size_t size, std::optional<std::uint64_t> hold_at = std::nullopt) {
    FakeFetcher::Script s;
    s.payload = payload(size);
    s.hold_at = hold_at;
    return s;
}

transferq::ManagerConfig quickConfig(const fs::path& root, int max_retries = 3) {
    transferq::ManagerConfig config;
    config.download_dir = root / "dl";
    config.cache_dir = root / "cache";
    config.max_retries = max_retries;
    config.retry_base_delay = 1ms;
    config.sample_interval = 5ms;
    config.listener_buffer = 8192;
    return config;
}

// HEAD that never answers. With `honour_stop` it gives up once asked to stop,
// otherwise only release() ends it.
class StallingProbeFetcher final : public transferq::Fetcher {
public:
    explicit StallingProbeFetcher(bool honour_stop) : honour_stop_(honour_stop) {}

    transferq::FetchInfo probe(const std::string&, const std::function<bool()>& keep_going) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        while (!released_) {
            if (honour_stop_ && !keep_going()) {
                break;
            }
            cv_.wait_for(lock, 5ms);
        }
        return {};
    }

    transferq::FetchOutcome fetch(const transferq::FetchRequest&, const transferq::FetchCallbacks&) override {
        return transferq::FetchOutcome::Stopped;
    }

    bool waitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    const bool honour_stop_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
};

struct Harness {
    TempDir dir;
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    std::shared_ptr<FakeArchiver> archiver = std::make_shared<FakeArchiver>();
    std::unique_ptr<transferq::TransferManager> manager;
    transferq::SubscriptionPtr events;
    std::vector<transferq::Event> seen;

    explicit Harness(const std::string& tag, int max_retries = 3, transferq::QueueJournalPtr journal = nullptr)
        : dir(tag) {
        manager = std::make_unique<transferq::TransferManager>(quickConfig(dir.path(), max_retries), fetcher,
                                                               archiver, std::move(journal));
        events = manager->subscribe();
    }

    fs::path cacheDir() const { return dir.path() / "cache"; }
    fs::path downloadDir() const { return dir.path() / "dl"; }

    const std::vector<transferq::Event>& collect() {
        auto fresh = events->drain();
        seen.insert(seen.end(), fresh.begin(), fresh.end());
        return seen;
    }

    bool waitIdle() {
        return waitFor([this] {
            const auto status = manager->getStatus();
            return !status.active && status.queue.empty();
        });
    }

    std::vector<std::string> statusTexts(const std::string& hash) {
        std::vector<std::string> texts;
        for (const auto& event : collect()) {
            if (event.type == transferq::EventType::Status && event.hash == hash) {
                texts.push_back(event.text);
            }
        }
        return texts;
    }

    bool sawStatus(const std::string& hash, const std::string& prefix) {
        const auto texts = statusTexts(hash);
        return std::any_of(texts.begin(), texts.end(),
                           [&prefix](const std::string& text) { return text.rfind(prefix, 0) == 0; });
    }

    std::string statusStartingWith(const std::string& hash, const std::string& prefix) {
        for (const auto& text : statusTexts(hash)) {
            if (text.rfind(prefix, 0) == 0) {
                return text;
            }
        }
        return {};
    }

    std::vector<std::string> completed() {
        std::vector<std::string> hashes;
        for (const auto& event : collect()) {
            if (event.type == transferq::EventType::Complete) {
                hashes.push_back(event.hash);
            }
        }
        return hashes;
    }

    bool cacheHas(const std::string& hash) const {
        std::error_code ec;
        for (fs::directory_iterator it{cacheDir(), ec}, end; !ec && it != end; it.increment(ec)) {
            if (it->path().filename().string().rfind(hash, 0) == 0) {
                return true;
            }
        }
        return false;
    }
};

bool throwsValidation(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const transferq::ValidationError&) {
        return true;
    }
    return false;
}

void test_fifo_single_active(TestContext& t) {
    Harness h("fifo");
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(30));
    h.fetcher->add(kZ, script(30));

    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.fetcher->waitUntilHeld(kX), "first transfer should start immediately");
    t.check(h.manager->activeCount() == 1, "exactly one transfer should hold the Active slot");

    const auto status = h.manager->getStatus();
    t.check(status.active && status.hash == hx, "first enqueued transfer should be active");
    t.check(status.status == transferq::TransferStatus::Active, "active transfer should report Active");
    t.check(status.queue.size() == 2 && status.queue[0].hash == hy && status.queue[1].hash == hz,
            "remaining transfers should wait in FIFO order");
    t.check(status.bytes_total == 100 && status.bytes_done == 50, "status should reflect bytes on disk");
    t.check(std::fabs(status.progress - 50.0) < 1e-9, "status progress should be derived from bytes");
    t.check(status.alias == "X" && status.source == kX, "status should carry alias and source");

    h.fetcher->release(kX);
    t.check(h.waitIdle(), "queue should drain");

    const auto done = h.completed();
    t.check(done.size() == 3 && done[0] == hx && done[1] == hy && done[2] == hz,
            "transfers should complete in enqueue order");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(100), "finished file should be moved to downloads");
    t.check(!h.cacheHas(hx), "moved artifact should leave the cache");
    t.check(h.sawStatus(hx, "Finished"), "finished transfer should emit Finished");

    t.check(h.manager->activeCount() == 0, "drained queue should leave the Active slot empty");
    const auto idle = h.manager->getStatus();
    t.check(!idle.active && std::isinf(idle.remaining_time) && idle.speed == 0.0,
            "idle status should have no speed and unknown remaining time");
}

void test_pause_resume_keeps_progress(TestContext& t) {
    Harness h("pause");
    h.fetcher->add(kX, script(100, 40));
    const auto hx = h.manager->enqueue(kX, "X");
    t.check(h.fetcher->waitUntilHeld(kX), "transfer should reach 40%");

    h.manager->pause();
    h.manager->pause();
    auto status = h.manager->getStatus();
    t.check(status.is_paused && status.status == transferq::TransferStatus::Paused, "status should show paused");
    t.check(status.speed == 0.0 && std::isinf(status.remaining_time), "paused transfer should have zero speed");

    h.fetcher->release(kX);
    t.check(waitFor([&h] { return h.manager->getStatus().bytes_done == 50; }),
            "in-flight chunk should land before the worker parks");
    std::this_thread::sleep_for(40ms);
    t.check(h.manager->getStatus().bytes_done == 50, "no data should move while paused");

    const auto pauses = h.statusTexts(hx);
    t.check(std::count(pauses.begin(), pauses.end(), "Paused") == 1, "double pause should emit one Paused");

    h.manager->resume();
    h.manager->resume();
    t.check(h.waitIdle(), "resumed transfer should finish");

    bool resumed = false;
    double last = -1.0;
    bool monotonic = true;
    bool below_pause_point = false;
    for (const auto& event : h.collect()) {
        if (event.hash != hx) {
            continue;
        }
        if (event.type == transferq::EventType::Status && event.text == "Resumed") {
            resumed = true;
        }
        if (event.type == transferq::EventType::Progress) {
            monotonic = monotonic && event.percent >= last;
            last = event.percent;
            if (resumed && event.percent < 40.0) {
                below_pause_point = true;
            }
        }
    }
    t.check(resumed, "resume should emit Resumed");
    t.check(monotonic, "progress must never decrease");
    t.check(!below_pause_point, "progress after resume must not drop below the pause point");
    t.check(last == 100.0, "final progress should be 100");
    t.check(h.fetcher->offsets(kX).size() == 1, "pause must not restart the transfer");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(100), "paused transfer should finish intact");
}

void test_reorder_permutation_only(TestContext& t) {
    Harness h("reorder");
    h.fetcher->add(kX, script(50, 20));
    h.fetcher->add(kY, script(20));
    h.fetcher->add(kZ, script(20));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager->reorderQueue({hz, hy});
    auto queue = h.manager->getStatus().queue;
    t.check(queue.size() == 2 && queue[0].hash == hz && queue[1].hash == hy, "valid permutation should apply");

    t.check(throwsValidation([&] { h.manager->reorderQueue({hz}); }), "partial list should be rejected");
    t.check(throwsValidation([&] { h.manager->reorderQueue({hz, hy, hx}); }),
            "active hash in the list should be rejected");
    queue = h.manager->getStatus().queue;
    t.check(queue.size() == 2 && queue[0].hash == hz && queue[1].hash == hy, "rejected reorder should change nothing");
    t.check(h.manager->getStatus().hash == hx, "reorder should not touch the active transfer");

    h.fetcher->release(kX);
    t.check(h.waitIdle(), "queue should drain");
    const auto done = h.completed();
    t.check(done.size() == 3 && done[0] == hx && done[1] == hz && done[2] == hy,
            "completion should follow the new order");
}

void test_enqueue_dedup_and_validation(TestContext& t) {
    Harness h("dedup");
    h.fetcher->add(kX, script(50, 20));
    h.fetcher->add(kY, script(20));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    t.check(h.manager->enqueue(kY, "Y") == hy, "duplicate queued enqueue should return the same hash");
    t.check(h.manager->enqueue(kX, "X") == hx, "duplicate active enqueue should return the same hash");
    t.check(h.manager->getStatus().queue.size() == 1, "duplicates should not grow the queue");
    t.check(throwsValidation([&] { h.manager->enqueue("", "nothing"); }), "empty source should be rejected");

    const auto derived = h.manager->enqueue("https://files.test/hollow-knight-free-download-v1-5/", "");
    const auto queue = h.manager->getStatus().queue;
    t.check(queue.size() == 2 && queue[1].hash == derived && queue[1].alias == "Hollow Knight",
            "empty alias should be derived from the source");
}

void test_cancel_removes_artifact_and_promotes(TestContext& t) {
    {
        Harness h("cancel");
        h.fetcher->add(kX, script(100, 50));
        const auto hx = h.manager->enqueue(kX, "X");
        t.check(h.fetcher->waitUntilHeld(kX), "X should be active");
        t.check(h.cacheHas(hx), "partial artifact should be in the cache");

        h.manager->cancel();
        t.check(!h.manager->getStatus().active, "cancel should clear the active slot");
        t.check(!h.cacheHas(hx), "cancel should delete the partial artifact");
        t.check(h.sawStatus(hx, "Cancelled"), "cancel should emit Cancelled");
        t.check(h.completed().empty(), "cancelled transfer must not complete");

        h.manager->cancel();
        t.check(!h.manager->getStatus().active, "cancel with nothing active should be a no-op");
    }
    {
        Harness h("cancel-next");
        h.fetcher->add(kX, script(100, 50));
        h.fetcher->add(kY, script(100, 50));
        h.manager->enqueue(kX, "X");
        const auto hy = h.manager->enqueue(kY, "Y");
        t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

        h.manager->cancel();
        const auto status = h.manager->getStatus();
        t.check(status.active && status.hash == hy, "next queued transfer should be promoted in the same turn");
        t.check(status.queue.empty(), "promoted transfer should leave the queue");
    }
}

void test_remove_from_queue(TestContext& t) {
    Harness h("remove");
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(20));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");
    writeFile(h.cacheDir() / (hy + ".bin"), "stale partial");

    t.check(throwsValidation([&] { h.manager->removeFromQueue("0000"); }), "unknown hash should be rejected");
    h.manager->removeFromQueue(hy);
    t.check(h.manager->getStatus().queue.empty(), "removed transfer should leave the queue");
    t.check(!h.cacheHas(hy), "removed transfer's cache entries should be deleted");

    h.manager->removeFromQueue(hx);
    t.check(!h.manager->getStatus().active, "removing the active transfer should cancel it");
    t.check(!h.cacheHas(hx), "removing the active transfer should delete its artifact");
    t.check(h.sawStatus(hx, "Cancelled"), "removing the active transfer should emit Cancelled");
}

void test_demote_active_resumes_later(TestContext& t) {
    Harness h("demote");
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(30, 10));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager->demoteActive(0);
    const auto status = h.manager->getStatus();
    t.check(status.active && status.hash == hy, "the queued job should be promoted after a demotion");
    t.check(status.queue.size() == 1 && status.queue[0].hash == hx, "demoted job should wait in the queue");
    t.check(h.cacheHas(hx), "demotion should keep the partial artifact");
    t.check(h.sawStatus(hx, "Queued"), "demotion should emit Queued");
    h.fetcher->release(kX);
    h.fetcher->release(kY);
    t.check(h.waitIdle(), "queue should drain");

    const auto done = h.completed();
    t.check(done.size() == 2 && done[0] == hy && done[1] == hx, "the other job should run before the demoted one");
    const auto offsets = h.fetcher->offsets(kX);
    t.check(offsets.size() == 2 && offsets[0] == 0 && offsets[1] == 50,
            "demoted transfer should resume from its artifact offset");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(100), "resumed artifact should be intact");

    t.check(throwsValidation([&] { h.manager->demoteActive(0); }), "demote with nothing active should be rejected");
}

void test_demote_only_job_restarts_it(TestContext& t) {
    Harness h("demote-alone");
    h.fetcher->add(kX, script(100, 50));
    const auto hx = h.manager->enqueue(kX, "X");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager->demoteActive(0);
    const auto status = h.manager->getStatus();
    t.check(status.active && status.hash == hx, "a lone demoted job should be promoted again");
    h.fetcher->release(kX);
    t.check(h.waitIdle(), "re-promoted job should finish");
    const auto offsets = h.fetcher->offsets(kX);
    t.check(offsets.size() == 2 && offsets[1] == 50, "re-promoted job should resume, not restart");
}

void test_activate_from_queue(TestContext& t) {
    Harness h("activate");
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(30, 10));
    h.fetcher->add(kZ, script(50, 10));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager->activate(hz, 1);
    auto status = h.manager->getStatus();
    t.check(status.active && status.hash == hz, "activated job should take the slot");
    t.check(status.queue.size() == 2 && status.queue[0].hash == hy && status.queue[1].hash == hx,
            "previous active job should go back at the requested position");

    t.check(throwsValidation([&] { h.manager->activate("feedface", 0); }), "unknown hash should be rejected");
    h.manager->activate(hz, 0);
    status = h.manager->getStatus();
    t.check(status.hash == hz && status.queue.size() == 2, "activating the active job should change nothing");

    h.fetcher->release(kX);
    h.fetcher->release(kY);
    h.fetcher->release(kZ);
    t.check(h.waitIdle(), "queue should drain");
    const auto done = h.completed();
    t.check(done.size() == 3 && done[0] == hz && done[1] == hy && done[2] == hx,
            "completion should follow the activation order");
}

void test_transport_retry_with_backoff(TestContext& t) {
    Harness h("retry");
    auto flaky = script(100);
    flaky.failures = 2;
    flaky.fail_after = 30;
    h.fetcher->add(kX, flaky);
    const auto hx = h.manager->enqueue(kX, "X");
    t.check(h.waitIdle(), "flaky transfer should finish");

    const auto offsets = h.fetcher->offsets(kX);
    t.check(offsets.size() == 3, "two failures should cost two retries");
    if (offsets.size() == 3) {
        t.check(offsets[0] == 0 && offsets[1] == 30 && offsets[2] == 60, "retries should resume from disk");
    }
    t.check(h.sawStatus(hx, "Retrying (1/3)..."), "first retry should be announced");
    t.check(h.sawStatus(hx, "Retrying (2/3)..."), "second retry should be announced");
    t.check(h.completed().size() == 1, "retried transfer should complete");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(100), "retried file should be intact");
}

void test_retry_without_range_support_restarts(TestContext& t) {
    Harness h("retry-norange");
    auto flaky = script(60);
    flaky.supports_range = false;
    flaky.failures = 1;
    flaky.fail_after = 30;
    h.fetcher->add(kX, flaky);
    const auto hx = h.manager->enqueue(kX, "X");
    t.check(h.waitIdle(), "flaky transfer without ranges should finish");

    const auto offsets = h.fetcher->offsets(kX);
    t.check(offsets.size() == 2 && offsets[0] == 0 && offsets[1] == 0,
            "a source without range support should be retried from byte 0");
    t.check(h.sawStatus(hx, "Retrying (1/3)..."), "the retry should be announced");
    t.check(h.completed().size() == 1, "restarted transfer should complete, not fail");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(60), "restarted file should be intact");
}

void test_retries_exhausted_fail_and_continue(TestContext& t) {
    Harness h("exhausted", 2);
    auto broken = script(100);
    broken.failures = 100;
    h.fetcher->add(kX, broken);
    auto fatal = script(100);
    fatal.failures = 1;
    fatal.retryable = false;
    h.fetcher->add(kY, fatal);
    h.fetcher->add(kZ, script(20));

    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.waitIdle(), "queue should drain despite failures");

    t.check(h.fetcher->offsets(kX).size() == 3, "max_retries=2 should allow three attempts");
    t.checkContains(h.statusStartingWith(hx, "Failed:"), "transport error",
                    "exhausted retries should fail with a transport error");
    t.check(h.fetcher->offsets(kY).size() == 1, "non-retryable failures should not be retried");
    t.check(h.sawStatus(hy, "Failed:"), "non-retryable failure should fail the job");
    const auto done = h.completed();
    t.check(done.size() == 1 && done[0] == hz, "later jobs should still run");
}

void test_capacity_errors(TestContext& t) {
    Harness h("capacity");
    auto full = script(100);
    full.capacity_failure = true;
    h.fetcher->add(kX, full);
    auto huge = script(10);
    huge.reported_length = 1ULL << 60;
    h.fetcher->add(kY, huge);
    h.fetcher->add(kZ, script(20));

    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.waitIdle(), "queue should drain");

    t.checkContains(h.statusStartingWith(hx, "Failed:"), "capacity error", "ENOSPC should fail as capacity error");
    t.check(h.fetcher->offsets(kX).size() == 1, "capacity errors should not be retried");
    t.checkContains(h.statusStartingWith(hy, "Failed:"), "Insufficient disk space",
                    "pre-flight space check should fail oversized transfers");
    t.check(h.fetcher->offsets(kY).empty(), "pre-flight failure should not start the transport");
    const auto done = h.completed();
    t.check(done.size() == 1 && done[0] == hz, "capacity failures should not halt the queue");
}

void test_archive_extraction(TestContext& t) {
    const std::string archive = "https://files.test/pack.zip";
    {
        Harness h("extract");
        h.fetcher->add(archive, script(64));
        const auto hash = h.manager->enqueue(archive, "Pack");
        t.check(h.waitIdle(), "archive transfer should finish");

        const fs::path destination = h.downloadDir() / hash;
        t.check(readFile(destination / "content.txt") == payload(64), "archive should be extracted per hash");
        t.check(!h.cacheHas(hash), "extracted archive should be deleted from the cache");
        t.check(h.sawStatus(hash, "Extracting..."), "extraction should be announced");
        bool complete_path = false;
        for (const auto& event : h.collect()) {
            if (event.type == transferq::EventType::Complete && event.hash == hash) {
                complete_path = event.text == destination.string();
            }
        }
        t.check(complete_path, "complete event should carry the destination");
    }
    {
        Harness h("extract-fail");
        h.archiver->fail = true;
        h.fetcher->add(archive, script(64));
        h.fetcher->add(kY, script(20));
        const auto hash = h.manager->enqueue(archive, "Pack");
        const auto hy = h.manager->enqueue(kY, "Y");
        t.check(h.waitIdle(), "queue should drain after an archive failure");

        t.checkContains(h.statusStartingWith(hash, "Failed:"), "archive error", "corrupt archive should fail the job");
        t.check(h.cacheHas(hash), "failed extraction should leave the artifact in the cache");
        t.check(h.fetcher->offsets(archive).size() == 1, "archive errors should not be retried");
        const auto done = h.completed();
        t.check(done.size() == 1 && done[0] == hy, "archive failure should not halt the queue");
    }
}

void test_cache_reuse(TestContext& t) {
    Harness h("cache");
    h.fetcher->add(kX, script(80));
    const auto hx = transferq::makeFingerprint(kX, "X");
    writeFile(h.cacheDir() / (hx + ".bin"), payload(80));

    auto stale = script(40);
    h.fetcher->add(kY, stale);
    const auto hy = transferq::makeFingerprint(kY, "Y");
    writeFile(h.cacheDir() / (hy + ".bin"), payload(60));

    auto no_range = script(40);
    no_range.supports_range = false;
    h.fetcher->add(kZ, no_range);
    const auto hz = transferq::makeFingerprint(kZ, "Z");
    writeFile(h.cacheDir() / (hz + ".bin"), payload(20));

    h.manager->enqueue(kX, "X");
    h.manager->enqueue(kY, "Y");
    h.manager->enqueue(kZ, "Z");
    t.check(h.waitIdle(), "queue should drain");

    t.check(h.fetcher->offsets(kX).empty(), "complete cached artifact should skip the transport");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(80), "cache hit should still be finalized");
    const auto y_offsets = h.fetcher->offsets(kY);
    t.check(y_offsets.size() == 1 && y_offsets[0] == 0, "oversized cached artifact should be discarded");
    const auto z_offsets = h.fetcher->offsets(kZ);
    t.check(z_offsets.size() == 1 && z_offsets[0] == 0, "partial artifact without range support should restart");
    t.check(readFile(h.downloadDir() / (hz + ".bin")) == payload(40), "restarted transfer should be intact");
    t.check(h.completed().size() == 3, "all three transfers should complete");
}

void test_clean_cache_spares_active(TestContext& t) {
    Harness h("clean");
    h.fetcher->add(kX, script(100, 50));
    const auto hx = h.manager->enqueue(kX, "X");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");
    writeFile(h.cacheDir() / "deadbeef.bin", "junk");
    writeFile(h.cacheDir() / "cafebabe.zip", "junk");

    t.check(h.manager->cleanCache() == 2, "clean should remove every inactive entry");
    t.check(h.cacheHas(hx), "clean must not delete the active artifact");
    h.fetcher->release(kX);
    t.check(h.waitIdle(), "active transfer should finish after clean");
    t.check(readFile(h.downloadDir() / (hx + ".bin")) == payload(100), "active artifact should be intact");
}

void test_speed_limit(TestContext& t) {
    Harness h("limit");
    auto big = script(20 * 1024);
    big.chunk_size = 1024;
    h.fetcher->add(kX, big);

    h.manager->setSpeedLimit(10);
    const auto started = std::chrono::steady_clock::now();
    h.manager->enqueue(kX, "X");
    t.check(h.waitIdle(), "throttled transfer should finish");
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    t.check(elapsed.count() > 0.6, "20 KiB at 10 KiB/s with a one second burst should take about a second");
    h.manager->setSpeedLimit(0);
}

void test_shutdown_keeps_partial_artifact(TestContext& t) {
    Harness h("shutdown");
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(20));
    const auto hx = h.manager->enqueue(kX, "X");
    h.manager->enqueue(kY, "Y");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager.reset();
    t.check(h.cacheHas(hx), "shutdown should keep the partial artifact for a later resume");
    t.check(h.fetcher->offsets(kY).empty(), "shutdown should not promote queued transfers");
}

void test_cancel_while_probe_stalls(TestContext& t) {
    TempDir dir("probe-stall");
    auto fetcher = std::make_shared<StallingProbeFetcher>(true);
    transferq::TransferManager manager(quickConfig(dir.path()), fetcher, nullptr);
    manager.enqueue(kX, "X");
    t.check(fetcher->waitEntered(), "the size probe should start");

    const auto started = std::chrono::steady_clock::now();
    manager.cancel();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    t.check(elapsed < 1s, "cancel should interrupt a stalled size probe");
    t.check(manager.activeCount() == 0 && !manager.getStatus().active, "cancelled probe should free the slot");
}

void test_status_answers_while_stop_is_pending(TestContext& t) {
    TempDir dir("stop-pending");
    auto fetcher = std::make_shared<StallingProbeFetcher>(false);
    transferq::TransferManager manager(quickConfig(dir.path()), fetcher, nullptr);
    const auto hx = manager.enqueue(kX, "X");
    t.check(fetcher->waitEntered(), "the size probe should start");

    std::thread canceller([&manager] { manager.cancel(); });
    std::this_thread::sleep_for(50ms);

    const auto started = std::chrono::steady_clock::now();
    const auto status = manager.getStatus();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    t.check(elapsed < 500ms, "status should answer while the worker has not acknowledged a stop");
    t.check(status.active && status.hash == hx, "the stopping transfer should stay visible until it stops");

    fetcher->release();
    canceller.join();
    t.check(!manager.getStatus().active, "cancel should complete once the worker returns");
}

void test_queue_saved_on_every_change(TestContext& t) {
    auto journal = std::make_shared<MemoryJournal>();
    Harness h("journal", 3, journal);
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(20));
    h.fetcher->add(kZ, script(20));

    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    const auto hz = h.manager->enqueue(kZ, "Z");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");
    t.check(journal->hashes() == std::vector<std::string>({hx, hy, hz}),
            "saved queue should list the active transfer first, then the queue");

    h.manager->reorderQueue({hz, hy});
    t.check(journal->hashes() == std::vector<std::string>({hx, hz, hy}), "reorder should be saved");

    h.manager->removeFromQueue(hy);
    t.check(journal->hashes() == std::vector<std::string>({hx, hz}), "remove should be saved");

    h.fetcher->release(kX);
    t.check(h.waitIdle(), "queue should drain");
    t.check(journal->saved().empty(), "finished transfers should leave the saved queue");
}

void test_saved_queue_resumes_on_start(TestContext& t) {
    TempDir seed("journal-seed");
    const auto hx = transferq::makeFingerprint(kX, "X");
    const auto hy = transferq::makeFingerprint(kY, "Y");

    transferq::Transfer x;
    x.hash = hx;
    x.source = kX;
    x.alias = "X";
    x.bytes_done = 40;
    transferq::Transfer y;
    y.hash = hy;
    y.source = kY;
    y.alias = "Y";
    auto journal = std::make_shared<MemoryJournal>(std::vector<transferq::Transfer>{x, y});

    // The partial artifact left by the previous run.
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->add(kX, script(100));
    fetcher->add(kY, script(20));
    const auto config = quickConfig(seed.path());
    fs::create_directories(config.cache_dir);
    writeFile(config.cache_dir / (hx + ".bin"), payload(100).substr(0, 40));

    {
        transferq::TransferManager manager(config, fetcher, nullptr, journal);
        t.check(waitFor([&manager] {
                    const auto status = manager.getStatus();
                    return !status.active && status.queue.empty();
                }),
                "restored queue should run without new commands");
    }

    const auto offsets = fetcher->offsets(kX);
    t.check(offsets.size() == 1 && offsets[0] == 40, "restored transfer should resume from its artifact");
    t.check(readFile(config.download_dir / (hx + ".bin")) == payload(100), "resumed file should be intact");
    t.check(readFile(config.download_dir / (hy + ".bin")) == payload(20), "second saved transfer should run too");
    t.check(journal->saved().empty(), "drained queue should be saved empty");
}

void test_shutdown_saves_parked_transfer(TestContext& t) {
    auto journal = std::make_shared<MemoryJournal>();
    Harness h("journal-shutdown", 3, journal);
    h.fetcher->add(kX, script(100, 50));
    h.fetcher->add(kY, script(20));
    const auto hx = h.manager->enqueue(kX, "X");
    const auto hy = h.manager->enqueue(kY, "Y");
    t.check(h.fetcher->waitUntilHeld(kX), "X should be active");

    h.manager.reset();
    const auto saved = journal->saved();
    t.check(saved.size() == 2 && saved[0].hash == hx && saved[1].hash == hy,
            "shutdown should save the parked transfer ahead of the queue");
    t.check(!saved.empty() && saved[0].bytes_done == 50 && saved[0].source == kX && saved[0].alias == "X",
            "parked transfer should be saved with its progress");
}

} // namespace

int main() {
    TestContext t;
    test_fifo_single_active(t);
    test_pause_resume_keeps_progress(t);
    test_reorder_permutation_only(t);
    test_enqueue_dedup_and_validation(t);
    test_cancel_removes_artifact_and_promotes(t);
    test_remove_from_queue(t);
    test_demote_active_resumes_later(t);
    test_demote_only_job_restarts_it(t);
    test_activate_from_queue(t);
    test_transport_retry_with_backoff(t);
    test_retry_without_range_support_restarts(t);
    test_retries_exhausted_fail_and_continue(t);
    test_capacity_errors(t);
    test_archive_extraction(t);
    test_cache_reuse(t);
    test_clean_cache_spares_active(t);
    test_speed_limit(t);
    test_shutdown_keeps_partial_artifact(t);
    test_cancel_while_probe_stalls(t);
    test_status_answers_while_stop_is_pending(t);
    test_queue_saved_on_every_change(t);
    test_saved_queue_resumes_on_start(t);
    test_shutdown_saves_parked_transfer(t);
    return t.finish("scheduler_tests");
}
