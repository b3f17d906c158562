#pragma once

#include "queue_journal.hpp"

#include <filesystem>
#include <vector>

namespace transferq {

// QueueJournal kept as a JSON array in a single file. Saves go through a
// sibling ".tmp" file and a rename, so a crash leaves the old copy intact.
class JsonQueueJournal final : public QueueJournal {
public:
    explicit JsonQueueJournal(std::filesystem::path path);

    [[nodiscard]] std::vector<Transfer> load() override;
    void save(const std::vector<Transfer>& transfers) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace transferq
