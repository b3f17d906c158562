#pragma once

#include <cstdint>
#include <string>

namespace transferq {

enum class EventType {
    Status,   // coarse state transition text
    Progress, // percent in [0, 100]
    Meta,     // resolved filename
    Complete  // destination path / completion message
};

[[nodiscard]] const char* toString(EventType type) noexcept;

struct Event {
    EventType type{EventType::Status};
    std::string hash;
    std::string text;
    double percent{0.0};
    std::uint64_t sequence{0}; // assigned by the channel, lets listeners spot gaps
};

} // namespace transferq
