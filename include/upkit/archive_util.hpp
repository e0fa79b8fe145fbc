#ifndef UPKIT_ARCHIVE_UTIL_HPP
#define UPKIT_ARCHIVE_UTIL_HPP

#include <filesystem>
#include <string>

namespace upkit {

class ArchiveUtil {
public:
    // Unpacks any format libarchive understands into `destPath`. Entries that
    // would land outside `destPath` (absolute paths, "..", symlink tricks)
    // fail the whole extraction. `error` receives the reason on failure.
    static bool extract(const std::filesystem::path& archivePath,
                        const std::filesystem::path& destPath,
                        std::string& error);
};

} // namespace upkit

#endif // UPKIT_ARCHIVE_UTIL_HPP
