#include "transferq/status_panel.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace transferq {

namespace {

constexpr std::size_t name_width = 24;

std::string displayName(const std::string& alias, const std::string& hash) {
    std::string name = alias.empty() ? hash : alias;
    if (name.size() > name_width) {
        name = name.substr(0, name_width - 3) + "...";
    }
    return name;
}

} // namespace

std::string StatusPanel::build(const StatusSnapshot& status) {
    std::string panel;
    panel.reserve(status.queue.size() * 64 + 512);
    panel.append("==================================================\n");
    panel += fmt::format("Transfer Queue ({} queued)\n", status.queue.size());
    panel.append("--------------------------------------------------\n");

    if (status.active) {
        panel += formatActiveLine(status);
    } else {
        panel.append("Active: (idle)");
    }
    panel.push_back('\n');

    if (!status.queue.empty()) {
        panel.append("--------------------------------------------------\n");
        std::size_t position = 0;
        for (const auto& entry : status.queue) {
            panel += fmt::format("{:>3}. {:<{}} {}\n", position++, displayName(entry.alias, entry.hash),
                                 name_width, entry.hash);
        }
    }
    panel.append("==================================================\n");
    return panel;
}

std::string StatusPanel::formatActiveLine(const StatusSnapshot& status) {
    std::string line;
    line.reserve(256);

    const std::string name = displayName(status.alias, status.hash);
    const double ratio = std::clamp(status.progress / 100.0, 0.0, 1.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    if (status.bytes_total > 0) {
        line += fmt::format("{:<{}} [{}] {:>3}% ({}/{})", name, name_width, bar,
                            static_cast<int>(status.progress), formatSize(status.bytes_done),
                            formatSize(status.bytes_total));
    } else {
        line += fmt::format("{:<{}} [Initializing...] {}", name, name_width, formatSize(status.bytes_done));
    }

    if (status.is_paused) {
        line.append("  || Paused");
    } else if (status.is_processing) {
        line.append("  Processing...");
    } else {
        line += fmt::format("  {}  ETA {}", formatSpeed(status.speed), formatDuration(status.remaining_time));
    }
    return line;
}

std::string StatusPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string StatusPanel::formatSpeed(double bytes_per_second) {
    if (!(bytes_per_second > 0.0)) {
        return "0 B/s";
    }
    return formatSize(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string StatusPanel::formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "--:--";
    }
    const auto total = static_cast<std::uint64_t>(std::llround(seconds));
    const std::uint64_t hours = total / 3600;
    const std::uint64_t minutes = (total % 3600) / 60;
    const std::uint64_t secs = total % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}", minutes, secs);
}

void StatusPanel::redraw(std::ostream& out, const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out << "\033[" << previous_lines_ << "F\033[J";
    }
    out << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace transferq
