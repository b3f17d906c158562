#pragma once

#include "fetcher.hpp"

#include <functional>
#include <memory>
#include <string>

namespace transferq {

class CurlFetcher final : public Fetcher {
public:
    struct Options {
        std::string user_agent{"transferq/1.0"};
        long connect_timeout_seconds{30};
        // Abort a request that moves less than one byte per second for this long.
        long low_speed_time_seconds{60};
    };

    CurlFetcher();
    explicit CurlFetcher(Options options);
    ~CurlFetcher() override;

    [[nodiscard]] FetchInfo probe(const std::string& source, const std::function<bool()>& keep_going) override;
    FetchOutcome fetch(const FetchRequest& request, const FetchCallbacks& callbacks) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferq
