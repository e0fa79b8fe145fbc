#include "upkit/config.hpp"
#include "upkit/downloader.hpp"
#include "upkit/errors.hpp"
#include "upkit/feed_client.hpp"
#include "upkit/http.hpp"
#include "upkit/installer.hpp"
#include "upkit/integrity_verifier.hpp"
#include "upkit/logger.hpp"
#include "upkit/orchestrator.hpp"
#include "upkit/path_manager.hpp"
#include "upkit/process.hpp"
#include "upkit/single_instance.hpp"
#include "upkit/version.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RETRYABLE = 1;
constexpr int EXIT_FATAL = 2;
constexpr int EXIT_LOCKED = 3;
constexpr int EXIT_USAGE = 64;

volatile std::sig_atomic_t interrupted = 0;

void onSignal(int) { interrupted = 1; }

struct CliOptions {
  std::string command;
  bool verbose = false;
  bool yes = false;
  bool force = false;
  std::string root;
  std::string current;
  std::string channel;
};

void showHelp() {
  std::cout
      << "upkit - application auto-updater\n\n"
      << "Usage: upkit [command] [flags]\n\n"
      << "Commands:\n"
      << "  check      Look for a newer release and report it (Default)\n"
      << "  update     Download, verify and install the newest release\n"
      << "  status     Show configuration and the last check result\n"
      << "  help       Show this help message\n\n"
      << "Flags:\n"
      << "  -v, --verbose       Enable verbose logging to stdout\n"
      << "  --root <dir>        Data directory (config, staging, logs)\n"
      << "  --current <ver>     Version of the installed build\n"
      << "  --channel <name>    Release channel: stable or test\n"
      << "  --yes               Restart the application after installing\n"
      << "  --force             Check even if the schedule says not yet\n"
      << "  --version           Print the upkit version\n";
}

// Returns false and prints the reason on a usage error.
bool parseArgs(const std::vector<std::string> &args, CliOptions &opts) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    auto takeValue = [&](std::string &out) {
      if (i + 1 >= args.size()) {
        std::cerr << "upkit: " << arg << " requires a value\n";
        return false;
      }
      out = args[++i];
      return true;
    };

    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--yes" || arg == "-y") {
      opts.yes = true;
    } else if (arg == "--force") {
      opts.force = true;
    } else if (arg == "--root") {
      if (!takeValue(opts.root))
        return false;
    } else if (arg == "--current") {
      if (!takeValue(opts.current))
        return false;
    } else if (arg == "--channel") {
      if (!takeValue(opts.channel))
        return false;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "upkit: unknown flag " << arg << "\n";
      return false;
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      std::cerr << "upkit: unexpected argument " << arg << "\n";
      return false;
    }
  }
  if (opts.command.empty())
    opts.command = "check";
  return true;
}

std::string formatTime(std::int64_t epoch) {
  if (epoch <= 0)
    return "never";
  std::time_t t = static_cast<std::time_t>(epoch);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

int showStatus() {
  auto &cfg = upkit::Config::instance();
  std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
  const auto &u = cfg.getUpdate();
  const auto &i = cfg.getInstall();
  auto &paths = upkit::PathManager::instance();

  std::cout << "Data root:        " << paths.root().string() << "\n"
            << "Current version:  " << u.currentVersion << "\n"
            << "Feed:             "
            << (u.feedUrl.empty() ? "(not configured)" : u.feedUrl) << "\n"
            << "Platform:         " << u.platform << "\n"
            << "Channel:          " << u.channel << "\n"
            << "Check frequency:  "
            << upkit::checkFrequencyName(u.checkFrequency) << "\n"
            << "Install dir:      "
            << (i.installDir.empty() ? "(not configured)" : i.installDir)
            << "\n"
            << "Last check:       " << formatTime(u.lastCheck);
  if (!u.lastCheckResult.empty())
    std::cout << " (" << u.lastCheckResult << ")";
  std::cout << "\n";
  if (!u.ignoredVersions.empty()) {
    std::cout << "Ignored versions:";
    for (const auto &v : u.ignoredVersions)
      std::cout << " " << v;
    std::cout << "\n";
  }
  return EXIT_OK;
}

// Blocks until the orchestrator has nothing left to do, forwarding Ctrl-C as
// a cancel request.
void waitForWorker(upkit::InstallOrchestrator &orchestrator) {
  bool cancelSent = false;
  while (!orchestrator.waitUntilSettled(std::chrono::milliseconds(100))) {
    if (interrupted && !cancelSent) {
      cancelSent = true;
      if (!orchestrator.cancel()) {
        std::cerr << "\nCannot cancel now, please wait...\n";
      }
    }
  }
}

int exitCodeFor(const upkit::UpdateSession &session) {
  if (session.state == upkit::UpdateState::CANCELLED)
    return EXIT_RETRYABLE;
  if (session.state != upkit::UpdateState::FAILED)
    return EXIT_OK;
  if (session.error && !upkit::isRetryable(session.error->kind))
    return EXIT_FATAL;
  return EXIT_RETRYABLE;
}

int runUpdate(const CliOptions &opts) {
  auto &cfg = upkit::Config::instance();
  upkit::UpdateConfig update;
  upkit::InstallConfig installCfg;
  {
    std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
    update = cfg.getUpdate();
    installCfg = cfg.getInstall();
  }

  const bool fullUpdate = opts.command == "update";

  upkit::OrchestratorSettings settings;
  try {
    settings.currentVersion = upkit::VersionComparator::parse(
        opts.current.empty() ? update.currentVersion : opts.current);
  } catch (const upkit::MalformedVersion &e) {
    std::cerr << "upkit: " << e.what() << "\n";
    return EXIT_USAGE;
  }

  auto channel =
      upkit::parseChannel(opts.channel.empty() ? update.channel : opts.channel);
  if (!channel) {
    std::cerr << "upkit: unknown channel '"
              << (opts.channel.empty() ? update.channel : opts.channel)
              << "'\n";
    return EXIT_USAGE;
  }

  if (update.feedUrl.empty()) {
    std::cerr << "upkit: no update.feed_url configured in "
              << upkit::PathManager::instance().configFile().string() << "\n";
    return EXIT_USAGE;
  }
  if (fullUpdate &&
      (installCfg.installDir.empty() || installCfg.entryPoint.empty())) {
    std::cerr << "upkit: install.install_dir and install.entry_point must be "
                 "configured for 'update'\n";
    return EXIT_USAGE;
  }

  settings.feedBaseUrl = update.feedUrl;
  settings.platform = update.platform;
  settings.channel = *channel;
  settings.stagingDir = upkit::PathManager::instance().staging();
  settings.installDir = installCfg.installDir;
  settings.layout.entryPoint = installCfg.entryPoint;
  for (const auto &c : installCfg.requiredComponents)
    settings.layout.requiredComponents.emplace_back(c);
  settings.relaunchArgs = installCfg.relaunchArgs;
  settings.ignoredVersions = update.ignoredVersions;
  settings.autoDownload = fullUpdate;
  settings.autoInstall = fullUpdate;

  auto timeout = std::chrono::seconds(std::max(1, update.timeoutSeconds));
  upkit::RetryPolicy policy;
  policy.maxAttempts = std::max(1, update.maxAttempts);
  policy.initialBackoff =
      std::chrono::milliseconds(std::max(0, update.initialBackoffMs));

  auto verifier = std::make_shared<upkit::IntegrityVerifier>();
  auto transport = std::make_shared<upkit::HTTP>();

  std::unique_ptr<upkit::InstallOrchestrator> orchestrator;
  try {
    orchestrator = std::make_unique<upkit::InstallOrchestrator>(
        settings,
        std::make_shared<upkit::FeedClient>(transport, verifier, timeout),
        std::make_shared<upkit::Downloader>(transport, verifier, policy,
                                            timeout),
        std::make_shared<upkit::ArchiveInstaller>(),
        std::make_shared<upkit::ProcessRelauncher>(), verifier);
  } catch (const std::invalid_argument &e) {
    std::cerr << "upkit: " << e.what() << "\n";
    return EXIT_USAGE;
  }

  int lastPercent = -1;
  orchestrator->subscribe([&](const upkit::UpdateEvent &event) {
    using Type = upkit::UpdateEvent::Type;
    const auto &s = event.session;
    if (event.type == Type::PROGRESS) {
      int percent = static_cast<int>(s.progressFraction * 100.0f);
      if (percent != lastPercent) {
        lastPercent = percent;
        std::cout << "\rDownloading... " << percent << "%" << std::flush;
      }
      return;
    }
    if (s.state == upkit::UpdateState::VERIFIED) {
      std::cout << "\rDownload verified.      \n";
    } else if (s.state == upkit::UpdateState::INSTALLING) {
      std::cout << "Installing...\n";
    }
  });

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  bool started = opts.force
                     ? orchestrator->checkNow()
                     : orchestrator->checkIfDue(update.checkFrequency,
                                                update.lastCheck);
  if (!started) {
    std::cout << "Update check not due (" +
                     upkit::checkFrequencyName(update.checkFrequency) +
                     "); use --force to check now.\n";
    return EXIT_OK;
  }

  waitForWorker(*orchestrator);
  auto session = orchestrator->getSessionState();

  {
    std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
    auto &u = cfg.getUpdate();
    u.lastCheck = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    if (session.candidate)
      u.lastCheckResult = "update_available";
    else if (session.state == upkit::UpdateState::FAILED)
      u.lastCheckResult = "error";
    else
      u.lastCheckResult = "no_update";
    cfg.save();
  }

  switch (session.state) {
  case upkit::UpdateState::IDLE:
    std::cout << "Up to date (" << settings.currentVersion.toString() << ").\n";
    break;
  case upkit::UpdateState::UPDATE_AVAILABLE: {
    const auto &c = *session.candidate;
    std::cout << "Update available: " << c.displayVersion << " ("
              << c.artifactSizeBytes << " bytes)\n";
    if (c.releaseNotesUrl)
      std::cout << "Release notes: " << *c.releaseNotesUrl << "\n";
    std::cout << "Run 'upkit update' to install it.\n";
    break;
  }
  case upkit::UpdateState::RESTART_PENDING:
    std::cout << "Installed " << session.candidate->displayVersion << ".\n";
    if (opts.yes) {
      orchestrator->restartNow();
      waitForWorker(*orchestrator);
      session = orchestrator->getSessionState();
      if (session.state == upkit::UpdateState::IDLE)
        std::cout << "Application restarted.\n";
    } else {
      std::cout << "Restart the application to finish updating.\n";
    }
    break;
  default:
    break;
  }

  if (session.state == upkit::UpdateState::FAILED && session.error) {
    std::cerr << "Update failed: " << session.error->message << "\n";
    if (!upkit::isRetryable(session.error->kind)) {
      std::cerr << "Please reinstall the application manually.\n";
    }
  } else if (session.state == upkit::UpdateState::CANCELLED) {
    std::cerr << "\nUpdate cancelled.\n";
  }

  return exitCodeFor(session);
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty())
      args.push_back(arg);
  }

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return EXIT_OK;
  }

  if (!args.empty() && args[0] == "--version") {
    std::cout << "upkit v" << upkit::UPKIT_VERSION_STRING << "\n";
    return EXIT_OK;
  }

  CliOptions opts;
  if (!parseArgs(args, opts)) {
    showHelp();
    return EXIT_USAGE;
  }

  if (opts.command != "check" && opts.command != "update" &&
      opts.command != "status") {
    std::cerr << "upkit: unknown command " << opts.command << "\n";
    showHelp();
    return EXIT_USAGE;
  }

  auto &pathMgr = upkit::PathManager::instance();
  try {
    pathMgr.init(opts.root);
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "upkit: cannot prepare data directory: " << e.what() << "\n";
    return EXIT_RETRYABLE;
  }

  upkit::Logger::instance().init(pathMgr.currentLog(), opts.verbose);
  upkit::Logger::instance().setLevel(opts.verbose ? upkit::LogLevel::DEBUG
                                                  : upkit::LogLevel::INFO);
  LOG_INFO("upkit " + upkit::UPKIT_VERSION_STRING +
           " started. Command: " + opts.command);

  upkit::SingleInstance singleInstance(pathMgr.lockFile());
  if (!singleInstance.isPrimary()) {
    std::cerr << "upkit: another instance is already running.\n";
    return EXIT_LOCKED;
  }

  upkit::Config::instance().load(pathMgr.configFile());

  if (opts.command == "status")
    return showStatus();

  return runUpdate(opts);
}
