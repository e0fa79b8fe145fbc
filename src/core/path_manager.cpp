#include "upkit/path_manager.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace upkit {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    rootDir_ = resolveRoot(rootOverride);

    stagingDir_ = rootDir_ / "staging";
    logsDir_ = rootDir_ / "logs";
    configPath_ = rootDir_ / "config.json";
    lockFilePath_ = rootDir_ / "upkit.lock";

    std::filesystem::create_directories(rootDir_);
    std::filesystem::create_directories(stagingDir_);
    std::filesystem::create_directories(logsDir_);

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&in_time_t, &tm);
    std::stringstream ss;
    ss << "upkit_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("UPKIT_PATH");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && strlen(xdgDataHome) > 0) {
        return std::filesystem::absolute(xdgDataHome) / "upkit";
    }

    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";

    return std::filesystem::path(home) / ".local" / "share" / "upkit";
}

} // namespace upkit
