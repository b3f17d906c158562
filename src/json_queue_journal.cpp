#include "transferq/json_queue_journal.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace transferq {

namespace fs = std::filesystem;
using json = nlohmann::json;

JsonQueueJournal::JsonQueueJournal(fs::path path) : path_(std::move(path)) {}

std::vector<Transfer> JsonQueueJournal::load() {
    std::vector<Transfer> transfers;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return transfers;
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::warn("Cannot open saved queue {}", path_.string());
        return transfers;
    }

    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        spdlog::warn("Saved queue {} is not a JSON array, starting empty", path_.string());
        return transfers;
    }

    try {
        for (const auto& item : doc) {
            Transfer transfer;
            transfer.hash = item.value("hash", std::string());
            transfer.source = item.value("source", std::string());
            transfer.alias = item.value("alias", std::string());
            transfer.bytes_done = item.value("bytes_done", std::uint64_t{0});
            if (transfer.source.empty()) {
                spdlog::warn("Skipping saved entry without a source ({})", transfer.hash);
                continue;
            }
            transfers.push_back(std::move(transfer));
        }
    } catch (const json::exception& ex) {
        spdlog::warn("Saved queue {} is malformed ({}), starting empty", path_.string(), ex.what());
        transfers.clear();
    }
    return transfers;
}

void JsonQueueJournal::save(const std::vector<Transfer>& transfers) {
    json doc = json::array();
    for (const auto& transfer : transfers) {
        doc.push_back({
            {"hash", transfer.hash},
            {"source", transfer.source},
            {"alias", transfer.alias},
            {"bytes_done", transfer.bytes_done},
        });
    }

    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }
    fs::path staging = path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            throw std::runtime_error(fmt::format("Cannot write {}", staging.string()));
        }
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out) {
            throw std::runtime_error(fmt::format("Failed to write {}", staging.string()));
        }
    }
    fs::rename(staging, path_);
    spdlog::trace("Saved {} queue entries to {}", transfers.size(), path_.string());
}

} // namespace transferq
