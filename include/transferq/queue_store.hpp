#pragma once

#include "transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace transferq {

// Ordered pending transfers plus a single Active slot.
//
// Invariants: at most one transfer occupies the Active slot, no hash appears
// twice across slot and queue, and reordering is permutation-only. The store
// performs no locking; the Scheduler is its only mutator.
class QueueStore {
public:
    struct EnqueueResult {
        std::string hash;
        bool inserted{false};
    };

    // Duplicate hashes are a no-op that returns the existing hash.
    EnqueueResult enqueue(const std::string& source, const std::string& alias);

    // Enqueues a saved transfer keeping its bytes_done. The hash is recomputed
    // from source and alias.
    EnqueueResult restore(const Transfer& saved);

    // Removes a queued (not Active) transfer. Throws ValidationError for an
    // unknown hash.
    Transfer remove(const std::string& hash);

    // Accepts only an exact permutation of the queued hashes; anything else
    // throws ValidationError and leaves the queue untouched.
    void reorder(const std::vector<std::string>& ordered_hashes);

    // Pops the queue head into the Active slot if the slot is empty.
    std::optional<Transfer> promoteNext();

    // Clears the Active slot and reinserts that transfer at `position`
    // (clamped to the queue length) with its bytes_done preserved.
    void demoteActiveToQueue(std::size_t position);

    // Moves a queued transfer to the head. Throws ValidationError if the hash
    // is not queued.
    void moveToFront(const std::string& hash);

    // Empties the Active slot and returns the transfer with `final_status`,
    // which must be terminal (std::invalid_argument otherwise).
    std::optional<Transfer> retireActive(TransferStatus final_status);

    [[nodiscard]] Transfer* active() noexcept;
    [[nodiscard]] const Transfer* active() const noexcept;
    [[nodiscard]] const std::vector<Transfer>& queue() const noexcept { return queue_; }
    [[nodiscard]] std::vector<std::string> queuedHashes() const;
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_ ? 1U : 0U; }
    [[nodiscard]] bool contains(const std::string& hash) const;
    [[nodiscard]] bool isQueued(const std::string& hash) const;
    [[nodiscard]] bool empty() const noexcept { return queue_.empty() && !active_; }

private:
    std::vector<Transfer>::iterator findQueued(const std::string& hash);
    std::vector<Transfer>::const_iterator findQueued(const std::string& hash) const;

    std::vector<Transfer> queue_;
    std::optional<Transfer> active_;
    std::uint64_t next_order_{0};
};

} // namespace transferq
