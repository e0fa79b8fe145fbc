#include "upkit/orchestrator.hpp"
#include "upkit/errors.hpp"
#include "upkit/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace upkit {

namespace fs = std::filesystem;

// True when `child` is `parent` or lies below it.
static bool containsPath(const fs::path &parent, const fs::path &child) {
  std::error_code ec;
  fs::path p = fs::weakly_canonical(fs::absolute(parent), ec);
  if (ec)
    return false;
  fs::path c = fs::weakly_canonical(fs::absolute(child), ec);
  if (ec)
    return false;
  fs::path rel = c.lexically_relative(p);
  return !rel.empty() && *rel.begin() != "..";
}

InstallOrchestrator::InstallOrchestrator(
    OrchestratorSettings settings, std::shared_ptr<FeedClient> feedClient,
    std::shared_ptr<Downloader> downloader,
    std::shared_ptr<PlatformInstaller> installer,
    std::shared_ptr<Relauncher> relauncher,
    std::shared_ptr<const IntegrityVerifier> verifier)
    : settings_(std::move(settings)), feedClient_(std::move(feedClient)),
      downloader_(std::move(downloader)), installer_(std::move(installer)),
      relauncher_(std::move(relauncher)), verifier_(std::move(verifier)) {
  if (settings_.stagingDir.empty())
    throw std::invalid_argument("A staging directory is required");
  if (!settings_.installDir.empty() &&
      (containsPath(settings_.installDir, settings_.stagingDir) ||
       containsPath(settings_.stagingDir, settings_.installDir))) {
    throw std::invalid_argument("Staging directory " +
                                settings_.stagingDir.string() +
                                " overlaps install directory " +
                                settings_.installDir.string());
  }

  std::error_code ec;
  fs::create_directories(settings_.stagingDir, ec);
  if (ec)
    LOG_WARN("Could not create staging directory: " + ec.message());
}

InstallOrchestrator::~InstallOrchestrator() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopSource_.request_stop();
  }
  runner_.shutdown();
}

bool InstallOrchestrator::applyTransition(std::uint64_t sessionId,
                                          UpdateState to, const Mutator &mutate,
                                          UpdateEvent::Type type,
                                          std::optional<UpdateState> requiredFrom) {
  std::lock_guard<std::recursive_mutex> order(notifyMutex_);

  UpdateSession snapshot;
  UpdateState from;
  bool redirected = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.id != sessionId)
      return false;
    from = session_.state;
    if (requiredFrom && from != *requiredFrom)
      return false;

    // An accepted cancel wins over whatever result the phase produced.
    if ((from == UpdateState::CHECKING || from == UpdateState::DOWNLOADING) &&
        stopSource_.stop_requested() && to != UpdateState::FAILED &&
        to != UpdateState::CANCELLED) {
      to = UpdateState::CANCELLED;
      type = UpdateEvent::Type::STATE_CHANGED;
      redirected = true;
    }

    if (!isTransitionAllowed(from, to)) {
      LOG_WARN("Rejected transition " + stateName(from) + " -> " +
               stateName(to));
      return false;
    }

    session_.state = to;
    if (redirected) {
      session_.error = SessionError{ErrorKind::CANCELLED, "Cancelled by user"};
    } else if (mutate) {
      mutate(session_);
    }
    if (session_.isTerminal()) {
      session_.stagedArtifactPath.reset();
      clearStaging();
    }
    snapshot = session_;
  }

  LOG_INFO("Update session #" + std::to_string(sessionId) + ": " +
           stateName(from) + " -> " + stateName(to));
  if (to == UpdateState::FAILED && snapshot.error) {
    LOG_ERROR("Update failed (" +
              std::string(errorKindName(snapshot.error->kind)) +
              "): " + snapshot.error->message);
  }

  notify({type, snapshot});
  return !redirected;
}

void InstallOrchestrator::fail(std::uint64_t sessionId, ErrorKind kind,
                               const std::string &message) {
  UpdateState to =
      kind == ErrorKind::CANCELLED ? UpdateState::CANCELLED : UpdateState::FAILED;
  applyTransition(sessionId, to, [&](UpdateSession &s) {
    s.error = SessionError{kind, message};
  });
}

void InstallOrchestrator::reportProgress(std::uint64_t sessionId,
                                         float fraction) {
  std::lock_guard<std::recursive_mutex> order(notifyMutex_);
  UpdateSession snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.id != sessionId ||
        session_.state != UpdateState::DOWNLOADING)
      return;
    session_.progressFraction = fraction;
    snapshot = session_;
  }
  notify({UpdateEvent::Type::PROGRESS, snapshot});
}

void InstallOrchestrator::notify(const UpdateEvent &event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, listener] : listeners_)
      listeners.push_back(listener);
  }
  for (const auto &listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      LOG_ERROR("Update listener threw: " + std::string(e.what()));
    }
  }
}

bool InstallOrchestrator::dispatch(std::uint64_t sessionId,
                                   std::function<void()> task) {
  if (runner_.post(std::move(task)))
    return true;

  UpdateState state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state = session_.state;
  }
  // Checks and downloads end as cancelled; later phases never started.
  if (state == UpdateState::CHECKING || state == UpdateState::DOWNLOADING)
    fail(sessionId, ErrorKind::CANCELLED, "Updater is shutting down");
  else
    fail(sessionId, ErrorKind::INSTALL, "Updater is shutting down");
  return false;
}

bool InstallOrchestrator::checkNow() {
  std::lock_guard<std::recursive_mutex> order(notifyMutex_);

  UpdateSession snapshot;
  std::stop_token stop;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.isTerminal()) {
      LOG_WARN("Update check rejected: session #" +
               std::to_string(session_.id) + " is " +
               stateName(session_.state));
      return false;
    }

    UpdateSession fresh;
    fresh.id = ++nextSessionId_;
    fresh.state = UpdateState::CHECKING;
    session_ = std::move(fresh);
    stopSource_ = std::stop_source();
    stop = stopSource_.get_token();
    clearStaging();
    snapshot = session_;
  }

  LOG_INFO("Update session #" + std::to_string(snapshot.id) +
           ": checking for updates (current " +
           settings_.currentVersion.toString() + ", channel " +
           channelName(settings_.channel) + ")");
  notify({UpdateEvent::Type::STATE_CHANGED, snapshot});

  std::uint64_t id = snapshot.id;
  return dispatch(id, [this, id, stop] { runCheck(id, stop); });
}

bool InstallOrchestrator::checkIfDue(CheckFrequency frequency,
                                     std::int64_t lastCheck) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  if (!isCheckDue(frequency, lastCheck, now)) {
    LOG_DEBUG("Update check not due (" + checkFrequencyName(frequency) + ")");
    return false;
  }
  return checkNow();
}

bool InstallOrchestrator::proceed() {
  std::uint64_t id;
  ReleaseCandidate candidate;
  std::stop_token stop;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != UpdateState::UPDATE_AVAILABLE || !session_.candidate)
      return false;
    id = session_.id;
    candidate = *session_.candidate;
    stop = stopSource_.get_token();
  }

  if (!applyTransition(id, UpdateState::DOWNLOADING,
                       [](UpdateSession &s) { s.progressFraction = 0.0f; },
                       UpdateEvent::Type::STATE_CHANGED,
                       UpdateState::UPDATE_AVAILABLE)) {
    return false;
  }
  return dispatch(id, [this, id, candidate, stop] {
    runDownload(id, candidate, stop);
  });
}

bool InstallOrchestrator::dismiss() {
  std::uint64_t id;
  UpdateState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = session_.state;
    if (from != UpdateState::UPDATE_AVAILABLE && from != UpdateState::VERIFIED)
      return false;
    id = session_.id;
  }
  LOG_INFO("Update dismissed by user");
  return applyTransition(id, UpdateState::IDLE, nullptr,
                         UpdateEvent::Type::STATE_CHANGED, from);
}

bool InstallOrchestrator::install() {
  std::uint64_t id;
  ReleaseCandidate candidate;
  fs::path artifact;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != UpdateState::VERIFIED ||
        !session_.stagedArtifactPath || !session_.candidate) {
      LOG_WARN("Install refused: nothing verified to install (state " +
               stateName(session_.state) + ")");
      return false;
    }
    id = session_.id;
    candidate = *session_.candidate;
    artifact = *session_.stagedArtifactPath;
  }

  if (!isInsideStaging(artifact)) {
    LOG_ERROR("Install refused: " + artifact.string() +
              " is not inside the staging directory");
    return false;
  }

  if (!applyTransition(id, UpdateState::INSTALLING, nullptr,
                       UpdateEvent::Type::STATE_CHANGED,
                       UpdateState::VERIFIED)) {
    return false;
  }
  return dispatch(id, [this, id, candidate, artifact] {
    runInstall(id, candidate, artifact);
  });
}

bool InstallOrchestrator::restartNow() {
  std::uint64_t id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != UpdateState::RESTART_PENDING)
      return false;
    id = session_.id;
  }
  return dispatch(id, [this, id] { runRelaunch(id); });
}

bool InstallOrchestrator::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session_.state != UpdateState::CHECKING &&
      session_.state != UpdateState::DOWNLOADING) {
    LOG_DEBUG("Cancel ignored in state " + stateName(session_.state));
    return false;
  }
  LOG_INFO("Cancelling update session #" + std::to_string(session_.id));
  stopSource_.request_stop();
  return true;
}

UpdateSession InstallOrchestrator::getSessionState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_;
}

std::uint64_t InstallOrchestrator::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t id = ++nextListenerId_;
  listeners_[id] = std::move(listener);
  return id;
}

void InstallOrchestrator::unsubscribe(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

bool InstallOrchestrator::waitUntilSettled(std::chrono::milliseconds timeout) {
  return runner_.waitIdle(timeout);
}

void InstallOrchestrator::runCheck(std::uint64_t sessionId,
                                   std::stop_token stop) {
  try {
    std::string url = FeedClient::feedUrl(settings_.feedBaseUrl,
                                          settings_.platform, settings_.channel);
    auto candidates = feedClient_->fetchCandidates(url, settings_.platform, stop);
    if (stop.stop_requested())
      throw CancelledError("Update check cancelled");

    auto best = FeedClient::selectBest(candidates, settings_.currentVersion,
                                       settings_.channel);
    if (best && isIgnored(best->versionText)) {
      LOG_INFO("Version " + best->versionText + " is ignored by preference");
      best.reset();
    }

    if (!best) {
      LOG_INFO("No update available");
      applyTransition(sessionId, UpdateState::IDLE, nullptr,
                      UpdateEvent::Type::UP_TO_DATE);
      return;
    }

    LOG_INFO("Update available: " + best->displayVersion);
    bool offered = applyTransition(
        sessionId, UpdateState::UPDATE_AVAILABLE,
        [&](UpdateSession &s) { s.candidate = *best; });
    if (offered && settings_.autoDownload)
      proceed();
  } catch (const CancelledError &e) {
    fail(sessionId, ErrorKind::CANCELLED, e.what());
  } catch (const UpdateError &e) {
    fail(sessionId, e.kind(), e.what());
  } catch (const std::exception &e) {
    fail(sessionId, ErrorKind::DOWNLOAD, e.what());
  }
}

void InstallOrchestrator::runDownload(std::uint64_t sessionId,
                                      ReleaseCandidate candidate,
                                      std::stop_token stop) {
  try {
    fs::path artifact = downloader_->stage(
        candidate, settings_.stagingDir,
        [this, sessionId](float fraction, std::uint64_t, std::uint64_t) {
          reportProgress(sessionId, fraction);
        },
        stop);

    bool verified = applyTransition(
        sessionId, UpdateState::VERIFIED, [&](UpdateSession &s) {
          s.stagedArtifactPath = artifact;
          s.progressFraction = 1.0f;
        });
    if (!verified) {
      std::error_code ec;
      fs::remove(artifact, ec);
      return;
    }
    if (settings_.autoInstall)
      install();
  } catch (const CancelledError &e) {
    fail(sessionId, ErrorKind::CANCELLED, e.what());
  } catch (const UpdateError &e) {
    fail(sessionId, e.kind(), e.what());
  } catch (const std::exception &e) {
    fail(sessionId, ErrorKind::DOWNLOAD, e.what());
  }
}

void InstallOrchestrator::runInstall(std::uint64_t sessionId,
                                     ReleaseCandidate candidate,
                                     fs::path artifact) {
  // The file sat on disk since it was verified; check it again.
  std::optional<std::string> integrityError;
  auto size = verifier_->verifySize(artifact, candidate.artifactSizeBytes);
  if (!size.ok)
    integrityError = size.error;
  if (!integrityError && candidate.checksumSha256) {
    auto checksum = verifier_->verifyChecksum(artifact, *candidate.checksumSha256);
    if (!checksum.ok)
      integrityError = checksum.error;
  }
  if (integrityError) {
    std::error_code ec;
    fs::remove(artifact, ec);
    fail(sessionId, ErrorKind::INTEGRITY,
         "Staged artifact failed re-verification: " + *integrityError);
    return;
  }

  InstallResult result;
  try {
    result = installer_->apply(artifact, settings_.installDir);
  } catch (const std::exception &e) {
    result = InstallResult::failure(e.what());
  }

  if (!result.ok) {
    std::string detail = result.error.value_or("unknown error");
    if (installer_->rollback(settings_.installDir)) {
      fail(sessionId, ErrorKind::INSTALL,
           "Install failed, previous version restored: " + detail);
    } else {
      fail(sessionId, ErrorKind::FATAL,
           "Install failed and the previous version could not be restored: " +
               detail);
    }
    return;
  }

  auto structure = checkInstallStructure(settings_.installDir, settings_.layout);
  if (!structure.ok) {
    // The published build itself is incomplete; put the old one back but
    // still demand attention.
    bool restored = installer_->rollback(settings_.installDir);
    fail(sessionId, ErrorKind::FATAL,
         "Installed build is incomplete: " +
             structure.error.value_or("structural check failed") +
             (restored ? " (previous version restored)"
                       : " (previous version could not be restored)"));
    return;
  }

  installer_->commit(settings_.installDir);
  applyTransition(sessionId, UpdateState::RESTART_PENDING,
                  [](UpdateSession &s) { s.progressFraction = 1.0f; });
}

void InstallOrchestrator::runRelaunch(std::uint64_t sessionId) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.id != sessionId ||
        session_.state != UpdateState::RESTART_PENDING)
      return;
  }

  fs::path exe = settings_.installDir / settings_.layout.entryPoint;
  std::string error;
  bool launched = false;
  try {
    launched = relauncher_->relaunch(exe, settings_.relaunchArgs, error);
  } catch (const std::exception &e) {
    error = e.what();
  }

  if (launched) {
    applyTransition(sessionId, UpdateState::IDLE, nullptr,
                    UpdateEvent::Type::STATE_CHANGED,
                    UpdateState::RESTART_PENDING);
  } else {
    fail(sessionId, ErrorKind::FATAL,
         "Update installed but the application could not be restarted: " +
             error);
  }
}

bool InstallOrchestrator::isIgnored(const std::string &versionText) const {
  return std::find(settings_.ignoredVersions.begin(),
                   settings_.ignoredVersions.end(),
                   versionText) != settings_.ignoredVersions.end();
}

bool InstallOrchestrator::isInsideStaging(const fs::path &path) const {
  if (!containsPath(settings_.stagingDir, path))
    return false;
  std::error_code ec;
  return !fs::equivalent(path, settings_.stagingDir, ec);
}

void InstallOrchestrator::clearStaging() {
  std::error_code ec;
  std::vector<fs::path> entries;
  for (fs::directory_iterator it(settings_.stagingDir, ec), end;
       !ec && it != end; it.increment(ec)) {
    entries.push_back(it->path());
  }
  for (const auto &entry : entries) {
    std::error_code removeEc;
    fs::remove_all(entry, removeEc);
    if (removeEc)
      LOG_WARN("Could not clear " + entry.string() + ": " +
               removeEc.message());
  }
  fs::create_directories(settings_.stagingDir, ec);
}

} // namespace upkit
