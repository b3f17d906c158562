#include "transferq/queue_store.hpp"

#include "transferq/errors.hpp"
#include "transferq/fingerprint.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace transferq {

QueueStore::EnqueueResult QueueStore::enqueue(const std::string& source, const std::string& alias) {
    std::string hash = makeFingerprint(source, alias);
    if (contains(hash)) {
        return {std::move(hash), false};
    }

    Transfer transfer;
    transfer.hash = hash;
    transfer.source = source;
    transfer.alias = alias;
    transfer.status = TransferStatus::Queued;
    transfer.enqueue_order = next_order_++;
    queue_.push_back(std::move(transfer));
    return {std::move(hash), true};
}

QueueStore::EnqueueResult QueueStore::restore(const Transfer& saved) {
    auto result = enqueue(saved.source, saved.alias);
    if (result.inserted) {
        queue_.back().bytes_done = saved.bytes_done;
    }
    return result;
}

Transfer QueueStore::remove(const std::string& hash) {
    auto it = findQueued(hash);
    if (it == queue_.end()) {
        throw ValidationError(fmt::format("Unknown queued transfer: {}", hash));
    }
    Transfer removed = std::move(*it);
    queue_.erase(it);
    return removed;
}

void QueueStore::reorder(const std::vector<std::string>& ordered_hashes) {
    if (ordered_hashes.size() != queue_.size()) {
        throw ValidationError(fmt::format("Reorder expects {} hashes, got {}",
                                          queue_.size(), ordered_hashes.size()));
    }

    std::unordered_set<std::string> seen;
    std::vector<Transfer> reordered;
    reordered.reserve(queue_.size());
    for (const auto& hash : ordered_hashes) {
        if (!seen.insert(hash).second) {
            throw ValidationError(fmt::format("Duplicate hash in reorder: {}", hash));
        }
        auto it = findQueued(hash);
        if (it == queue_.end()) {
            throw ValidationError(fmt::format("Hash not in queue: {}", hash));
        }
        reordered.push_back(*it);
    }

    queue_ = std::move(reordered);
}

std::optional<Transfer> QueueStore::promoteNext() {
    if (active_ || queue_.empty()) {
        return std::nullopt;
    }
    active_ = std::move(queue_.front());
    queue_.erase(queue_.begin());
    active_->status = TransferStatus::Active;
    return active_;
}

void QueueStore::demoteActiveToQueue(std::size_t position) {
    if (!active_) {
        throw ValidationError("No active transfer to demote");
    }
    Transfer demoted = std::move(*active_);
    active_.reset();
    demoted.status = TransferStatus::Queued;

    const auto index = std::min(position, queue_.size());
    queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(index), std::move(demoted));
}

void QueueStore::moveToFront(const std::string& hash) {
    auto it = findQueued(hash);
    if (it == queue_.end()) {
        throw ValidationError(fmt::format("Hash not in queue: {}", hash));
    }
    std::rotate(queue_.begin(), it, it + 1);
}

std::optional<Transfer> QueueStore::retireActive(TransferStatus final_status) {
    if (!isTerminal(final_status)) {
        throw std::invalid_argument(fmt::format("Cannot retire a transfer as {}", toString(final_status)));
    }
    if (!active_) {
        return std::nullopt;
    }
    Transfer retired = std::move(*active_);
    active_.reset();
    retired.status = final_status;
    return retired;
}

Transfer* QueueStore::active() noexcept {
    return active_ ? &*active_ : nullptr;
}

const Transfer* QueueStore::active() const noexcept {
    return active_ ? &*active_ : nullptr;
}

std::vector<std::string> QueueStore::queuedHashes() const {
    std::vector<std::string> hashes;
    hashes.reserve(queue_.size());
    for (const auto& transfer : queue_) {
        hashes.push_back(transfer.hash);
    }
    return hashes;
}

bool QueueStore::contains(const std::string& hash) const {
    return (active_ && active_->hash == hash) || isQueued(hash);
}

bool QueueStore::isQueued(const std::string& hash) const {
    return findQueued(hash) != queue_.end();
}

std::vector<Transfer>::iterator QueueStore::findQueued(const std::string& hash) {
    return std::find_if(queue_.begin(), queue_.end(),
                        [&hash](const Transfer& t) { return t.hash == hash; });
}

std::vector<Transfer>::const_iterator QueueStore::findQueued(const std::string& hash) const {
    return std::find_if(queue_.begin(), queue_.end(),
                        [&hash](const Transfer& t) { return t.hash == hash; });
}

} // namespace transferq
