#pragma once

#include "transfer.hpp"

#include <memory>
#include <vector>

namespace transferq {

// Durable copy of the pending work: the Active transfer first, then the queue
// in order. Only hash, source, alias and bytes_done are kept.
class QueueJournal {
public:
    virtual ~QueueJournal() = default;

    // Empty when nothing was saved or the saved copy is unreadable.
    [[nodiscard]] virtual std::vector<Transfer> load() = 0;
    // Throws on I/O failure; the previous copy stays in place.
    virtual void save(const std::vector<Transfer>& transfers) = 0;
};

using QueueJournalPtr = std::shared_ptr<QueueJournal>;

} // namespace transferq
