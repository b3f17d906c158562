#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace transferq {

// On-disk store of partial and complete artifacts, one file per transfer
// named "<hash>.<ext>". Entries are addressed by hash prefix so any
// sidecar the fetcher leaves behind goes with its artifact.
class ArtifactCache {
public:
    explicit ArtifactCache(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Creates the cache directory. Throws std::runtime_error on failure.
    void ensureRoot() const;

    [[nodiscard]] std::filesystem::path artifactFor(const std::string& hash,
                                                    const std::string& extension) const;

    // Size of the artifact on disk, 0 if it does not exist.
    [[nodiscard]] std::uint64_t confirmedBytes(const std::filesystem::path& artifact) const;

    // Free bytes on the cache volume, nullopt when the filesystem cannot say.
    [[nodiscard]] std::optional<std::uint64_t> availableSpace() const;

    // Deletes every entry belonging to `hash`. Returns the number removed.
    std::size_t removeFor(const std::string& hash) const;

    // Deletes every entry except those belonging to `keep`. Returns the
    // number removed.
    std::size_t clean(const std::vector<std::string>& keep) const;

private:
    std::size_t removeMatching(const std::vector<std::string>& prefixes, bool keep_matches) const;

    std::filesystem::path root_;
};

} // namespace transferq
