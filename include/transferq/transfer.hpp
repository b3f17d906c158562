#pragma once

#include <cstdint>
#include <string>

namespace transferq {

enum class TransferStatus {
    Queued,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] const char* toString(TransferStatus status) noexcept;
[[nodiscard]] bool isTerminal(TransferStatus status) noexcept;

struct Transfer {
    std::string hash;
    std::string source;
    std::string alias;
    TransferStatus status{TransferStatus::Queued};
    std::uint64_t bytes_total{0};
    std::uint64_t bytes_done{0};
    std::uint64_t enqueue_order{0};
};

// Percentage of done/total clamped to [0, 100]. Unknown totals, NaN and
// negative ratios report 0.
[[nodiscard]] double percentOf(std::uint64_t done, std::uint64_t total) noexcept;
[[nodiscard]] double clampPercent(double value) noexcept;

} // namespace transferq
