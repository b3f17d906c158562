#include "transferq/libarchive_archiver.hpp"

#include "transferq/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <memory>
#include <string>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferq {

namespace fs = std::filesystem;

namespace {

struct ReadDeleter {
    void operator()(archive* ar) const noexcept {
        if (ar) {
            archive_read_free(ar);
        }
    }
};

struct WriteDeleter {
    void operator()(archive* aw) const noexcept {
        if (aw) {
            archive_write_free(aw);
        }
    }
};

std::string archiveMessage(archive* ar, const char* fallback) {
    const char* msg = archive_error_string(ar);
    return msg ? msg : fallback;
}

// Rejects entries that would land outside the destination.
fs::path safeJoin(const fs::path& base, const fs::path& rel) {
    const auto out = (base / rel).lexically_normal();
    const auto base_str = base.lexically_normal().native();
    const auto& out_str = out.native();
    if (out_str.size() < base_str.size() || out_str.compare(0, base_str.size(), base_str) != 0) {
        throw ArchiveError(fmt::format("Blocked path traversal in archive entry: {}", rel.string()));
    }
    return out;
}

// False when `keep_going` turns down the next data block.
bool copyData(archive* ar, archive* aw, const std::function<bool()>& keep_going) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    for (;;) {
        if (keep_going && !keep_going()) {
            return false;
        }
        const int r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return true;
        }
        if (r != ARCHIVE_OK) {
            throw ArchiveError(archiveMessage(ar, "extract data failed"));
        }
        if (archive_write_data_block(aw, buff, size, offset) != ARCHIVE_OK) {
            throw ArchiveError(archiveMessage(aw, "write data failed"));
        }
    }
}

} // namespace

bool LibarchiveArchiver::recognizes(const fs::path& artifact) const {
    static constexpr std::array<const char*, 6> kArchives{".zip", ".rar", ".7z", ".tar", ".tgz", ".txz"};
    static constexpr std::array<const char*, 4> kTarFilters{".gz", ".xz", ".bz2", ".zst"};

    auto lowered = [](std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    };

    const std::string ext = lowered(artifact.extension().string());
    if (std::find(kArchives.begin(), kArchives.end(), ext) != kArchives.end()) {
        return true;
    }
    // Bare compressed files are not archives; only .tar.<filter> is.
    return std::find(kTarFilters.begin(), kTarFilters.end(), ext) != kTarFilters.end() &&
           lowered(artifact.stem().extension().string()) == ".tar";
}

bool LibarchiveArchiver::extract(const fs::path& artifact, const fs::path& destination,
                                 const std::function<bool()>& keep_going) {
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        throw ArchiveError(fmt::format("Cannot create {}: {}", destination.string(), ec.message()));
    }

    std::unique_ptr<archive, ReadDeleter> reader{archive_read_new()};
    std::unique_ptr<archive, WriteDeleter> writer{archive_write_disk_new()};
    if (!reader || !writer) {
        throw ArchiveError("libarchive init failed");
    }

    archive_read_support_format_all(reader.get());
    archive_read_support_filter_all(reader.get());
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), artifact.c_str(), 64 * 1024) != ARCHIVE_OK) {
        throw ArchiveError(archiveMessage(reader.get(), "open archive failed"));
    }

    const fs::path base = destination.lexically_normal();
    std::size_t entries = 0;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        if (keep_going && !keep_going()) {
            spdlog::info("Extraction of {} stopped after {} entries", artifact.string(), entries);
            return false;
        }

        const char* name = archive_entry_pathname(entry);
        if (!name || !*name || fs::path(name).is_absolute()) {
            archive_read_data_skip(reader.get());
            continue;
        }

        const fs::path full = safeJoin(base, fs::path(name));
        archive_entry_set_pathname(entry, full.c_str());

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            throw ArchiveError(archiveMessage(writer.get(), "write header failed"));
        }
        if (!copyData(reader.get(), writer.get(), keep_going)) {
            spdlog::info("Extraction of {} stopped inside {}", artifact.string(), full.string());
            return false;
        }
        if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
            throw ArchiveError(archiveMessage(writer.get(), "finish entry failed"));
        }
        ++entries;
    }

    if (r != ARCHIVE_EOF) {
        throw ArchiveError(archiveMessage(reader.get(), "read header failed"));
    }

    archive_read_close(reader.get());
    archive_write_close(writer.get());
    spdlog::debug("Extracted {} entries from {}", entries, artifact.string());
    return true;
}

} // namespace transferq
