#pragma once

#include "archiver.hpp"

namespace transferq {

// Extracts zip, 7z, rar and tar family archives through libarchive.
class LibarchiveArchiver final : public Archiver {
public:
    [[nodiscard]] bool recognizes(const std::filesystem::path& artifact) const override;
    bool extract(const std::filesystem::path& artifact,
                 const std::filesystem::path& destination,
                 const std::function<bool()>& keep_going) override;
};

} // namespace transferq
