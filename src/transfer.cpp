#include "transferq/transfer.hpp"
#include "transferq/errors.hpp"

#include <cmath>

namespace transferq {

const char* toString(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Queued:
        return "queued";
    case TransferStatus::Active:
        return "active";
    case TransferStatus::Paused:
        return "paused";
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Failed:
        return "failed";
    case TransferStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Archive:
        return "archive";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Capacity:
        return "capacity";
    }
    return "unknown";
}

bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Completed || status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled;
}

double clampPercent(double value) noexcept {
    if (std::isnan(value) || value < 0.0) {
        return 0.0;
    }
    if (value > 100.0) {
        return 100.0;
    }
    return value;
}

double percentOf(std::uint64_t done, std::uint64_t total) noexcept {
    if (total == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(done) / static_cast<double>(total);
    return clampPercent(ratio * 100.0);
}

} // namespace transferq
