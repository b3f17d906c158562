#pragma once

#include <filesystem>
#include <functional>
#include <memory>

namespace transferq {

// Post-download extraction. extract() throws ArchiveError on corrupt or
// unsupported content and returns false when keep_going() asked it to stop.
class Archiver {
public:
    virtual ~Archiver() = default;

    [[nodiscard]] virtual bool recognizes(const std::filesystem::path& artifact) const = 0;
    virtual bool extract(const std::filesystem::path& artifact,
                         const std::filesystem::path& destination,
                         const std::function<bool()>& keep_going) = 0;
};

using ArchiverPtr = std::shared_ptr<Archiver>;

} // namespace transferq
