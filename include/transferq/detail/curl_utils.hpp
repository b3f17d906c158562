#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace transferq::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Runs curl_global_init once per process and registers the matching cleanup.
void ensureCurlInitialized();

// Fresh easy handle with the options every request shares. A transfer slower
// than 1 B/s for `low_speed_time_seconds` fails with CURLE_OPERATION_TIMEDOUT.
[[nodiscard]] CurlHandle makeEasyHandle(const std::string& url, const std::string& user_agent,
                                        long connect_timeout_seconds, long low_speed_time_seconds);

// Prefers the CURLOPT_ERRORBUFFER text over the generic code description.
[[nodiscard]] std::string describeCurlError(CURLcode code, const char* error_buffer);

} // namespace transferq::detail
