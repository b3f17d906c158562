#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace transferq {

struct ManagerConfig {
    std::filesystem::path download_dir{"Downloads"};
    std::filesystem::path cache_dir{"DownloadCache"};
    // Saved queue, reloaded on start. Kept outside cache_dir, which clean empties.
    std::filesystem::path queue_file{"transferq-queue.json"};

    std::uint64_t speed_limit_kib{0}; // 0 = unlimited
    int max_retries{3};
    std::chrono::milliseconds retry_base_delay{1000};

    std::chrono::milliseconds sample_interval{500};
    double speed_smoothing{0.3}; // EMA weight of the newest sample

    std::size_t listener_buffer{64};
    std::size_t listener_max_drops{256};

    long connect_timeout_seconds{30};
    long low_speed_time_seconds{60};
    std::string user_agent{"transferq/1.0"};
};

} // namespace transferq
