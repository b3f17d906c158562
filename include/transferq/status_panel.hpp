#pragma once

#include "status.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace transferq {

// Console rendering of a StatusSnapshot for the CLI.
class StatusPanel {
public:
    [[nodiscard]] static std::string build(const StatusSnapshot& status);
    [[nodiscard]] static std::string formatActiveLine(const StatusSnapshot& status);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    [[nodiscard]] static std::string formatSpeed(double bytes_per_second);
    // "--:--" for an unknown (infinite) duration.
    [[nodiscard]] static std::string formatDuration(double seconds);

    // Replaces the previously drawn panel in place.
    void redraw(std::ostream& out, const std::string& panel);
    void reset() noexcept { previous_lines_ = 0; }

private:
    std::size_t previous_lines_{0};
};

} // namespace transferq
