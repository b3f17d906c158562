#pragma once

#include "transfer.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace transferq {

struct QueueEntry {
    std::string hash;
    std::string alias;
};

// Canonical view of the manager, computed from live state per request.
struct StatusSnapshot {
    bool active{false};
    std::string hash;
    std::string source;
    std::string alias;
    TransferStatus status{TransferStatus::Queued};
    std::uint64_t bytes_total{0};
    std::uint64_t bytes_done{0};
    double progress{0.0};
    double speed{0.0};                                              // bytes/sec, smoothed
    double remaining_time{std::numeric_limits<double>::infinity()}; // seconds
    bool is_paused{false};
    bool is_processing{false}; // extracting or moving the finished artifact
    std::vector<QueueEntry> queue;
};

} // namespace transferq
