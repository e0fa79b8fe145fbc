#ifndef UPKIT_ORCHESTRATOR_HPP
#define UPKIT_ORCHESTRATOR_HPP

#include "upkit/config.hpp"
#include "upkit/downloader.hpp"
#include "upkit/feed_client.hpp"
#include "upkit/installer.hpp"
#include "upkit/integrity_verifier.hpp"
#include "upkit/process.hpp"
#include "upkit/session.hpp"
#include "upkit/task_runner.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace upkit {

struct OrchestratorSettings {
  std::string feedBaseUrl;
  std::string platform = "linux";
  VersionIdentifier currentVersion;
  Channel channel = Channel::STABLE;

  // Owned by the orchestrator: emptied at the start of every session and on
  // every terminal transition. Must not overlap the install directory.
  std::filesystem::path stagingDir;
  std::filesystem::path installDir;
  InstallLayout layout;
  std::vector<std::string> relaunchArgs;

  std::vector<std::string> ignoredVersions;
  bool autoDownload = false;
  bool autoInstall = false;
};

struct UpdateEvent {
  enum class Type { STATE_CHANGED, PROGRESS, UP_TO_DATE };

  Type type;
  UpdateSession session;
};

// Drives check -> download -> verify -> install -> relaunch for one
// application. All network and disk work runs on a private serial worker;
// the public methods only validate and enqueue, so they are safe to call
// from a UI thread.
class InstallOrchestrator {
public:
  using Listener = std::function<void(const UpdateEvent &)>;

  // Throws std::invalid_argument when the staging and install directories
  // overlap.
  InstallOrchestrator(OrchestratorSettings settings,
                      std::shared_ptr<FeedClient> feedClient,
                      std::shared_ptr<Downloader> downloader,
                      std::shared_ptr<PlatformInstaller> installer,
                      std::shared_ptr<Relauncher> relauncher,
                      std::shared_ptr<const IntegrityVerifier> verifier);
  ~InstallOrchestrator();

  // False when a session is already active.
  bool checkNow();
  bool checkIfDue(CheckFrequency frequency, std::int64_t lastCheck);

  // UpdateAvailable -> Downloading
  bool proceed();
  // UpdateAvailable or Verified -> Idle
  bool dismiss();
  // Verified -> Installing
  bool install();
  // RestartPending -> Idle once the new build has been started.
  bool restartNow();
  // Honoured only while Checking or Downloading.
  bool cancel();

  UpdateSession getSessionState() const;

  // Listeners run on whichever thread applied the transition (the worker,
  // or the caller for checkNow/dismiss/proceed/install), one notification at
  // a time. A listener may call back into the orchestrator but must not block
  // on waitUntilSettled().
  std::uint64_t subscribe(Listener listener);
  void unsubscribe(std::uint64_t id);

  // True once no work is queued or running.
  bool waitUntilSettled(std::chrono::milliseconds timeout);

  InstallOrchestrator(const InstallOrchestrator &) = delete;
  InstallOrchestrator &operator=(const InstallOrchestrator &) = delete;

private:
  using Mutator = std::function<void(UpdateSession &)>;

  bool applyTransition(std::uint64_t sessionId, UpdateState to,
                       const Mutator &mutate = nullptr,
                       UpdateEvent::Type type = UpdateEvent::Type::STATE_CHANGED,
                       std::optional<UpdateState> requiredFrom = std::nullopt);
  void fail(std::uint64_t sessionId, ErrorKind kind, const std::string &message);
  void reportProgress(std::uint64_t sessionId, float fraction);
  void notify(const UpdateEvent &event);
  bool dispatch(std::uint64_t sessionId, std::function<void()> task);

  void runCheck(std::uint64_t sessionId, std::stop_token stop);
  void runDownload(std::uint64_t sessionId, ReleaseCandidate candidate,
                   std::stop_token stop);
  void runInstall(std::uint64_t sessionId, ReleaseCandidate candidate,
                  std::filesystem::path artifact);
  void runRelaunch(std::uint64_t sessionId);

  bool isIgnored(const std::string &versionText) const;
  bool isInsideStaging(const std::filesystem::path &path) const;
  void clearStaging();

  OrchestratorSettings settings_;
  std::shared_ptr<FeedClient> feedClient_;
  std::shared_ptr<Downloader> downloader_;
  std::shared_ptr<PlatformInstaller> installer_;
  std::shared_ptr<Relauncher> relauncher_;
  std::shared_ptr<const IntegrityVerifier> verifier_;

  mutable std::mutex mutex_;
  // Held across a transition and its notification so listeners observe
  // transitions in the order they were applied.
  std::recursive_mutex notifyMutex_;
  UpdateSession session_;
  std::uint64_t nextSessionId_ = 0;
  std::stop_source stopSource_;
  std::map<std::uint64_t, Listener> listeners_;
  std::uint64_t nextListenerId_ = 0;

  TaskRunner runner_;
};

} // namespace upkit

#endif // UPKIT_ORCHESTRATOR_HPP
