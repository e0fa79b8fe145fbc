#include "upkit/config.hpp"
#include "upkit/logger.hpp"
#include "upkit/path_manager.hpp"
#include "upkit/session.hpp"
#include "upkit/single_instance.hpp"
#include "test_support.hpp"

#include <cassert>
#include <nlohmann/json.hpp>
#include <string>

using upkit::CheckFrequency;
using upkit::Config;
using upkit::UpdateState;
using upkit::test::TempDir;

namespace {

constexpr std::int64_t HOUR = 60 * 60;
constexpr std::int64_t DAY = 24 * HOUR;
constexpr std::int64_t NOW = 1700000000;

void checkSchedule() {
    assert(!upkit::isCheckDue(CheckFrequency::NEVER, 0, NOW));
    assert(!upkit::isCheckDue(CheckFrequency::NEVER, NOW - 365 * DAY, NOW));

    // Never checked before.
    assert(upkit::isCheckDue(CheckFrequency::MONTHLY, 0, NOW));

    assert(!upkit::isCheckDue(CheckFrequency::ON_STARTUP, NOW - 60, NOW));
    assert(upkit::isCheckDue(CheckFrequency::ON_STARTUP, NOW - HOUR, NOW));
    assert(!upkit::isCheckDue(CheckFrequency::DAILY, NOW - DAY + 1, NOW));
    assert(upkit::isCheckDue(CheckFrequency::DAILY, NOW - DAY, NOW));
    assert(!upkit::isCheckDue(CheckFrequency::WEEKLY, NOW - 6 * DAY, NOW));
    assert(upkit::isCheckDue(CheckFrequency::WEEKLY, NOW - 7 * DAY, NOW));
    assert(!upkit::isCheckDue(CheckFrequency::MONTHLY, NOW - 29 * DAY, NOW));
    assert(upkit::isCheckDue(CheckFrequency::MONTHLY, NOW - 30 * DAY, NOW));

    assert(upkit::parseCheckFrequency("weekly") == CheckFrequency::WEEKLY);
    assert(upkit::parseCheckFrequency("on_startup") == CheckFrequency::ON_STARTUP);
    assert(!upkit::parseCheckFrequency("hourly"));
    assert(upkit::checkFrequencyName(CheckFrequency::NEVER) == "never");
}

void missingFileIsCreated() {
    TempDir dir;
    auto path = dir / "nested/config.json";

    Config::instance().load(path);
    assert(std::filesystem::exists(path));
    assert(Config::instance().getUpdate().channel == "stable");
    assert(Config::instance().getUpdate().maxAttempts == 3);

    auto j = nlohmann::json::parse(upkit::test::readFile(path));
    assert(j["update"]["check_frequency"] == "on_startup");
    assert(j["install"]["entry_point"] == "");
}

void savedValuesSurviveReload() {
    TempDir dir;
    auto path = dir / "config.json";

    auto& config = Config::instance();
    config.load(path);
    config.getUpdate().feedUrl = "https://updates.example.com/app";
    config.getUpdate().channel = "test";
    config.getUpdate().checkFrequency = CheckFrequency::WEEKLY;
    config.getUpdate().ignoredVersions = {"2.0.0"};
    config.getUpdate().lastCheck = NOW;
    config.getInstall().entryPoint = "bin/app";
    config.getInstall().requiredComponents = {"lib/libruntime.so", "share/app"};
    config.save();

    config.load(dir / "other.json");
    assert(config.getUpdate().feedUrl.empty());

    config.load(path);
    assert(config.getUpdate().feedUrl == "https://updates.example.com/app");
    assert(config.getUpdate().channel == "test");
    assert(config.getUpdate().checkFrequency == CheckFrequency::WEEKLY);
    assert(config.getUpdate().ignoredVersions == std::vector<std::string>{"2.0.0"});
    assert(config.getUpdate().lastCheck == NOW);
    assert(config.getInstall().entryPoint == "bin/app");
    assert(config.getInstall().requiredComponents.size() == 2);
}

void malformedFileFallsBackToDefaults() {
    TempDir dir;
    auto path = dir / "config.json";

    upkit::test::writeFile(path, R"({"update": {"channel": "test", "check_frequency": "hourly"}})");
    Config::instance().load(path);
    assert(Config::instance().getUpdate().channel == "test");
    assert(Config::instance().getUpdate().checkFrequency == CheckFrequency::ON_STARTUP);

    upkit::test::writeFile(path, "{ \"update\": ");
    Config::instance().load(path);
    assert(Config::instance().getUpdate().channel == "stable");
    // The broken file is left for the user to fix.
    assert(upkit::test::readFile(path) == "{ \"update\": ");
}

void transitionTable() {
    using upkit::isTransitionAllowed;
    assert(isTransitionAllowed(UpdateState::IDLE, UpdateState::CHECKING));
    assert(isTransitionAllowed(UpdateState::FAILED, UpdateState::CHECKING));
    assert(isTransitionAllowed(UpdateState::CANCELLED, UpdateState::CHECKING));
    assert(isTransitionAllowed(UpdateState::DOWNLOADING, UpdateState::CANCELLED));
    assert(isTransitionAllowed(UpdateState::INSTALLING, UpdateState::RESTART_PENDING));

    assert(!isTransitionAllowed(UpdateState::IDLE, UpdateState::DOWNLOADING));
    assert(!isTransitionAllowed(UpdateState::CHECKING, UpdateState::VERIFIED));
    assert(!isTransitionAllowed(UpdateState::DOWNLOADING, UpdateState::INSTALLING));
    // Installing runs to completion.
    assert(!isTransitionAllowed(UpdateState::INSTALLING, UpdateState::CANCELLED));
    assert(!isTransitionAllowed(UpdateState::VERIFIED, UpdateState::CHECKING));

    upkit::UpdateSession session;
    assert(session.isTerminal() && !session.isActive());
    session.state = UpdateState::RESTART_PENDING;
    assert(session.isActive());
    assert(upkit::stateName(UpdateState::UPDATE_AVAILABLE) == "UpdateAvailable");
    assert(upkit::stateName(UpdateState::CANCELLED) == "Cancelled");
    assert(upkit::stateName(static_cast<UpdateState>(99)) == "Unknown");
}

void pathsAndLock() {
    TempDir dir;
    auto& paths = upkit::PathManager::instance();
    paths.init((dir / "data").string());

    assert(paths.root() == dir / "data");
    assert(std::filesystem::is_directory(paths.staging()));
    assert(std::filesystem::is_directory(paths.logs()));
    assert(paths.configFile() == dir / "data/config.json");
    assert(paths.currentLog().parent_path() == paths.logs());
    assert(paths.currentLog().filename().string().rfind("upkit_", 0) == 0);

    upkit::SingleInstance first(paths.lockFile());
    assert(first.isPrimary());
    {
        upkit::SingleInstance second(paths.lockFile());
        assert(!second.isPrimary());
    }
    assert(first.isPrimary());
}

void loggerForwardsToSink() {
    std::vector<std::string> lines;
    auto& logger = upkit::Logger::instance();
    logger.setSink([&](upkit::LogLevel, const std::string& line) { lines.push_back(line); });
    logger.setLevel(upkit::LogLevel::WARNING);

    LOG_INFO("filtered out");
    LOG_WARN("disk almost full");
    assert(lines.size() == 1);
    assert(lines[0].find("[WARN] disk almost full") != std::string::npos);

    logger.setSink(nullptr);
    logger.setLevel(upkit::LogLevel::DEBUG);
}

}  // namespace

int main() {
    loggerForwardsToSink();
    checkSchedule();
    missingFileIsCreated();
    savedValuesSurviveReload();
    malformedFileFallsBackToDefaults();
    transitionTable();
    pathsAndLock();
    return 0;
}
