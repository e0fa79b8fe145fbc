#include "upkit/archive_util.hpp"
#include "upkit/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <memory>

namespace upkit {

namespace {

struct ReaderDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct WriterDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

using Reader = std::unique_ptr<struct archive, ReaderDeleter>;
using Writer = std::unique_ptr<struct archive, WriterDeleter>;

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

// Entry names are rewritten to absolute paths below, so libarchive's own
// absolute-path guard cannot be used; check the stored name instead.
bool isContained(const std::string& name) {
    std::filesystem::path p(name);
    if (p.empty() || p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

int copyData(struct archive* ar, struct archive* aw) {
    int r;
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) return r;
        r = archive_write_data_block(aw, buff, size, offset);
        if (r < ARCHIVE_OK) return r;
    }
}

} // namespace

bool ArchiveUtil::extract(const std::filesystem::path& archivePath,
                          const std::filesystem::path& destPath,
                          std::string& error) {
    int flags = ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;

    Reader a(archive_read_new());
    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    Writer ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(), flags);
    archive_write_disk_set_standard_lookup(ext.get());

    if (archive_read_open_filename(a.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        error = "Could not open archive " + archivePath.string() + ": " + archiveError(a.get());
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(destPath, ec);
    std::filesystem::path root = ec ? destPath : std::filesystem::canonical(destPath, ec);
    if (ec) {
        error = "Could not create " + destPath.string() + ": " + ec.message();
        return false;
    }

    size_t entries = 0;
    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            error = "Corrupt archive: " + archiveError(a.get());
            return false;
        }
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive header warning: " + archiveError(a.get()));
        }

        const char* name = archive_entry_pathname(entry);
        std::string relPath = name ? name : "";
        if (!isContained(relPath)) {
            error = "Refusing archive entry '" + relPath + "': path escapes the destination";
            return false;
        }
        std::filesystem::path fullPath = root / relPath;
        archive_entry_set_pathname(entry, fullPath.c_str());

        // Hard links are stored relative to the archive root as well.
        if (const char* link = archive_entry_hardlink(entry)) {
            if (!isContained(link)) {
                error = "Refusing hard link '" + relPath + "' to '" + link + "'";
                return false;
            }
            std::filesystem::path linkPath = root / link;
            archive_entry_set_hardlink(entry, linkPath.c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_WARN) {
            error = "Refusing archive entry '" + relPath + "': " + archiveError(ext.get());
            return false;
        }
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive write header warning: " + archiveError(ext.get()));
        } else if (archive_entry_size(entry) > 0) {
            r = copyData(a.get(), ext.get());
            if (r < ARCHIVE_WARN) {
                error = "Archive data copy error: " + archiveError(ext.get());
                return false;
            }
        }

        r = archive_write_finish_entry(ext.get());
        if (r < ARCHIVE_WARN) {
            error = "Archive finish entry error: " + archiveError(ext.get());
            return false;
        }
        ++entries;
    }

    archive_read_close(a.get());
    if (archive_write_close(ext.get()) != ARCHIVE_OK) {
        error = "Could not finalize extraction: " + archiveError(ext.get());
        return false;
    }

    LOG_DEBUG("Extracted " + std::to_string(entries) + " entries into " + root.string());
    return true;
}

} // namespace upkit
