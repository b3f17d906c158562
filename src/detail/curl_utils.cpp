#include "transferq/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferq::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        spdlog::debug("libcurl {} initialized ({})", info ? info->version : "?",
                      info && info->ssl_version ? info->ssl_version : "no TLS");
    });
}

CurlHandle makeEasyHandle(const std::string& url, const std::string& user_agent,
                          long connect_timeout_seconds, long low_speed_time_seconds) {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return curl;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
    if (low_speed_time_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, low_speed_time_seconds);
    }
    if (!user_agent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    }
    return curl;
}

std::string describeCurlError(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return fmt::format("curl error {}: {}", static_cast<int>(code), error_buffer);
    }
    return fmt::format("curl error {}: {}", static_cast<int>(code), curl_easy_strerror(code));
}

} // namespace transferq::detail
