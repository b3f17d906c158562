#include "transferq/artifact_cache.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferq {

namespace fs = std::filesystem;

ArtifactCache::ArtifactCache(fs::path root) : root_(std::move(root)) {}

void ArtifactCache::ensureRoot() const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Failed to create cache directory {}: {}",
                                             root_.string(), ec.message()));
    }
}

fs::path ArtifactCache::artifactFor(const std::string& hash, const std::string& extension) const {
    return root_ / fmt::format("{}.{}", hash, extension);
}

std::uint64_t ArtifactCache::confirmedBytes(const fs::path& artifact) const {
    std::error_code ec;
    const auto size = fs::file_size(artifact, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::optional<std::uint64_t> ArtifactCache::availableSpace() const {
    std::error_code ec;
    const auto info = fs::space(root_, ec);
    if (ec) {
        spdlog::warn("Unable to query free space of {}: {}", root_.string(), ec.message());
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

std::size_t ArtifactCache::removeFor(const std::string& hash) const {
    return removeMatching({hash}, true);
}

std::size_t ArtifactCache::clean(const std::vector<std::string>& keep) const {
    return removeMatching(keep, false);
}

std::size_t ArtifactCache::removeMatching(const std::vector<std::string>& prefixes,
                                          bool keep_matches) const {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return 0;
    }

    std::vector<fs::path> doomed;
    for (fs::directory_iterator it{root_, ec}, end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        const bool matches = std::any_of(prefixes.begin(), prefixes.end(), [&name](const std::string& p) {
            return !p.empty() && name.compare(0, p.size(), p) == 0;
        });
        if (matches == keep_matches) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::error("Failed to scan cache {}: {}", root_.string(), ec.message());
    }

    std::size_t removed = 0;
    for (const auto& path : doomed) {
        std::error_code remove_ec;
        fs::remove_all(path, remove_ec);
        if (remove_ec) {
            spdlog::error("Failed to delete {} from cache: {}", path.filename().string(), remove_ec.message());
            continue;
        }
        ++removed;
    }
    return removed;
}

} // namespace transferq
