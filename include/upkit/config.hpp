#ifndef UPKIT_CONFIG_HPP
#define UPKIT_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace upkit {

enum class CheckFrequency { ON_STARTUP, DAILY, WEEKLY, MONTHLY, NEVER };

std::string checkFrequencyName(CheckFrequency frequency);
std::optional<CheckFrequency> parseCheckFrequency(const std::string &text);

// `lastCheck` and `now` are epoch seconds; lastCheck 0 means "never".
bool isCheckDue(CheckFrequency frequency, std::int64_t lastCheck,
                std::int64_t now);

struct UpdateConfig {
  std::string currentVersion = "0.0.0";
  std::string feedUrl = "";
  std::string platform = "linux";
  std::string channel = "stable";
  CheckFrequency checkFrequency = CheckFrequency::ON_STARTUP;
  bool autoDownload = false;
  bool autoInstall = false;
  std::vector<std::string> ignoredVersions;

  int timeoutSeconds = 10;
  int maxAttempts = 3;
  int initialBackoffMs = 500;

  // Written back after each check.
  std::int64_t lastCheck = 0;
  std::string lastCheckResult = ""; // update_available | no_update | error
};

struct InstallConfig {
  std::string installDir = "";
  std::string entryPoint = "";
  std::vector<std::string> requiredComponents;
  std::vector<std::string> relaunchArgs;
};

class Config {
public:
  static Config &instance();

  // Resets to defaults, then overlays whatever the file provides. A missing
  // file is created with defaults; a malformed one is logged and ignored.
  void load(const std::filesystem::path &configPath);
  void save();

  UpdateConfig &getUpdate() { return update_; }
  InstallConfig &getInstall() { return install_; }
  std::recursive_mutex &getMutex() { return mutex_; }

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  UpdateConfig update_;
  InstallConfig install_;

  std::recursive_mutex mutex_;
};

} // namespace upkit

#endif // UPKIT_CONFIG_HPP
