#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace transferq {

struct FetchInfo {
    std::uint64_t content_length{0}; // 0 when the source does not report it
    bool supports_range{false};
};

struct FetchRequest {
    std::string source;
    std::filesystem::path artifact;
    std::uint64_t offset{0}; // last confirmed byte already in the artifact
};

struct FetchCallbacks {
    // Total size learned during the transfer, when the probe did not know it.
    std::function<void(std::uint64_t total)> on_size;
    // Invoked after each buffer is written. Returning false stops the
    // transfer at this checkpoint.
    std::function<bool(std::size_t written)> on_chunk;
    // Polled while no data flows (connect, stalled peer). Returning false
    // aborts the transfer as Stopped.
    std::function<bool()> keep_going;
};

enum class FetchOutcome {
    Completed,
    Stopped
};

// Resumable byte-range transport for one source. Implementations throw
// TransportError for network/IO failures and CapacityError when the disk
// runs out of space.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Size and range support of `source`. Returns an empty FetchInfo when the
    // source does not say, or when `keep_going` turns false mid-request.
    [[nodiscard]] virtual FetchInfo probe(const std::string& source, const std::function<bool()>& keep_going) = 0;
    virtual FetchOutcome fetch(const FetchRequest& request, const FetchCallbacks& callbacks) = 0;
};

using FetcherPtr = std::shared_ptr<Fetcher>;

} // namespace transferq
