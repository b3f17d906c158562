#pragma once

#include <string>

namespace transferq {

// Stable 32 hex character fingerprint of source+alias. Used as the
// transfer's address and as the cache key.
[[nodiscard]] std::string makeFingerprint(const std::string& source, const std::string& alias);

// Human readable title derived from the last path segment of a URL,
// e.g. ".../hollow-knight-free-download-v1-5/" -> "Hollow Knight".
// Returns "Unknown" when the URL has no path.
[[nodiscard]] std::string aliasFromSource(const std::string& source);

// Lowercase file extension of the URL path without the leading dot
// ("zip", "tar.gz"), or "bin" when there is none.
[[nodiscard]] std::string extensionFromSource(const std::string& source);

} // namespace transferq
