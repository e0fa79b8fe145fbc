#include "upkit/config.hpp"
#include "upkit/logger.hpp"
#include <fstream>

namespace upkit {

using json = nlohmann::json;

std::string checkFrequencyName(CheckFrequency frequency) {
  switch (frequency) {
  case CheckFrequency::ON_STARTUP:
    return "on_startup";
  case CheckFrequency::DAILY:
    return "daily";
  case CheckFrequency::WEEKLY:
    return "weekly";
  case CheckFrequency::MONTHLY:
    return "monthly";
  case CheckFrequency::NEVER:
    return "never";
  }
  return "on_startup";
}

std::optional<CheckFrequency> parseCheckFrequency(const std::string &text) {
  for (auto f : {CheckFrequency::ON_STARTUP, CheckFrequency::DAILY,
                 CheckFrequency::WEEKLY, CheckFrequency::MONTHLY,
                 CheckFrequency::NEVER}) {
    if (checkFrequencyName(f) == text)
      return f;
  }
  return std::nullopt;
}

bool isCheckDue(CheckFrequency frequency, std::int64_t lastCheck,
                std::int64_t now) {
  constexpr std::int64_t HOUR = 60 * 60;
  constexpr std::int64_t DAY = 24 * HOUR;

  if (frequency == CheckFrequency::NEVER)
    return false;
  if (lastCheck <= 0)
    return true;

  std::int64_t elapsed = now - lastCheck;
  switch (frequency) {
  case CheckFrequency::ON_STARTUP:
    // Restarting the app twice in a row should not hit the feed twice.
    return elapsed >= HOUR;
  case CheckFrequency::DAILY:
    return elapsed >= DAY;
  case CheckFrequency::WEEKLY:
    return elapsed >= 7 * DAY;
  case CheckFrequency::MONTHLY:
    return elapsed >= 30 * DAY;
  case CheckFrequency::NEVER:
    return false;
  }
  return false;
}

Config &Config::instance() {
  static Config instance;
  return instance;
}

static std::vector<std::string> stringList(const json &j, const char *key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array())
    return out;
  for (const auto &item : j[key]) {
    if (item.is_string())
      out.push_back(item.get<std::string>());
  }
  return out;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;
  update_ = UpdateConfig{};
  install_ = InstallConfig{};

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;

    if (j.contains("update")) {
      auto &u = j["update"];
      update_.currentVersion = u.value("current_version", "0.0.0");
      update_.feedUrl = u.value("feed_url", "");
      update_.platform = u.value("platform", "linux");
      update_.channel = u.value("channel", "stable");

      std::string frequency = u.value("check_frequency", "on_startup");
      if (auto parsed = parseCheckFrequency(frequency)) {
        update_.checkFrequency = *parsed;
      } else {
        LOG_WARN("Unknown check_frequency '" + frequency +
                 "', using on_startup");
      }

      update_.autoDownload = u.value("auto_download", false);
      update_.autoInstall = u.value("auto_install", false);
      update_.ignoredVersions = stringList(u, "ignored_versions");
      update_.timeoutSeconds = u.value("timeout_seconds", 10);
      update_.maxAttempts = u.value("max_attempts", 3);
      update_.initialBackoffMs = u.value("initial_backoff_ms", 500);
      update_.lastCheck = u.value("last_check", static_cast<std::int64_t>(0));
      update_.lastCheckResult = u.value("last_check_result", "");
    }

    if (j.contains("install")) {
      auto &i = j["install"];
      install_.installDir = i.value("install_dir", "");
      install_.entryPoint = i.value("entry_point", "");
      install_.requiredComponents = stringList(i, "required_components");
      install_.relaunchArgs = stringList(i, "relaunch_args");
    }

    LOG_INFO("Configuration loaded from " + path.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
    update_ = UpdateConfig{};
    install_ = InstallConfig{};
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
  }

  json j;
  j["update"] = {{"current_version", update_.currentVersion},
                 {"feed_url", update_.feedUrl},
                 {"platform", update_.platform},
                 {"channel", update_.channel},
                 {"check_frequency", checkFrequencyName(update_.checkFrequency)},
                 {"auto_download", update_.autoDownload},
                 {"auto_install", update_.autoInstall},
                 {"ignored_versions", update_.ignoredVersions},
                 {"timeout_seconds", update_.timeoutSeconds},
                 {"max_attempts", update_.maxAttempts},
                 {"initial_backoff_ms", update_.initialBackoffMs},
                 {"last_check", update_.lastCheck},
                 {"last_check_result", update_.lastCheckResult}};

  j["install"] = {{"install_dir", install_.installDir},
                  {"entry_point", install_.entryPoint},
                  {"required_components", install_.requiredComponents},
                  {"relaunch_args", install_.relaunchArgs}};

  std::ofstream file(configPath_);
  if (!file) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return;
  }
  file << j.dump(4);
  LOG_DEBUG("Configuration saved to " + configPath_.string());
}

} // namespace upkit
