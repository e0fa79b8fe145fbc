#ifndef UPKIT_PATH_MANAGER_HPP
#define UPKIT_PATH_MANAGER_HPP

#include <filesystem>
#include <string>

namespace upkit {

class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional root override.
    // If rootOverride is empty, it checks UPKIT_PATH env, then XDG defaults.
    void init(const std::string& rootOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path staging() const { return stagingDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path configFile() const { return configPath_; }
    std::filesystem::path lockFile() const { return lockFilePath_; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path stagingDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path configPath_;
    std::filesystem::path lockFilePath_;
    std::filesystem::path currentLogPath_;

    std::filesystem::path resolveRoot(const std::string& override);
};

} // namespace upkit

#endif // UPKIT_PATH_MANAGER_HPP
