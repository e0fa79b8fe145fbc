#include "upkit/errors.hpp"
#include "upkit/logger.hpp"
#include "upkit/orchestrator.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
using nlohmann::json;
using upkit::ErrorKind;
using upkit::InstallOrchestrator;
using upkit::UpdateEvent;
using upkit::UpdateState;
using upkit::test::countEntries;
using upkit::test::ScriptedTransport;
using upkit::test::TempDir;

namespace {

const std::string kBase = "https://updates.example.com/app";
const std::string kFeedUrl = kBase + "/linux/stable/feed.json";
const std::string kArtifactUrl = "https://cdn.example.com/app-1.0.1.tar.gz";

class RecordingRelauncher : public upkit::Relauncher {
public:
    bool relaunch(const fs::path& exe, const std::vector<std::string>& args, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        launched.push_back(exe);
        lastArgs = args;
        if (!succeed) error = "exec failed";
        return succeed;
    }

    std::mutex mutex;
    bool succeed = true;
    std::vector<fs::path> launched;
    std::vector<std::string> lastArgs;
};

class ScriptedInstaller : public upkit::PlatformInstaller {
public:
    upkit::InstallResult apply(const fs::path&, const fs::path&) override {
        ++applyCalls;
        return applyOk ? upkit::InstallResult::success() : upkit::InstallResult::failure("disk full");
    }
    bool rollback(const fs::path&) override {
        ++rollbackCalls;
        return rollbackOk;
    }
    void commit(const fs::path&) override { ++commitCalls; }

    bool applyOk = true;
    bool rollbackOk = true;
    int applyCalls = 0;
    int rollbackCalls = 0;
    int commitCalls = 0;
};

struct Recorder {
    void operator()(const UpdateEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        if (event.type == UpdateEvent::Type::PROGRESS) {
            ++progressEvents;
            return;
        }
        if (event.type == UpdateEvent::Type::UP_TO_DATE) ++upToDateEvents;
        states.push_back(event.session.state);
    }

    std::vector<UpdateState> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }

    std::mutex mutex;
    std::vector<UpdateState> states;
    int progressEvents = 0;
    int upToDateEvents = 0;
};

std::string releaseArchive(bool withEntryPoint = true) {
    std::vector<upkit::test::ArchiveFile> files = {
        {"lib/libruntime.so", "ELF", 0644},
        {"VERSION", "1.0.1", 0644},
    };
    if (withEntryPoint) files.push_back({"bin/app", "#!/bin/sh\nexit 0\n", 0755});
    return upkit::test::makeTarGz(files);
}

std::string feedFor(const std::string& artifact, const std::string& version = "1.0.1") {
    json entry = {{"version", version},
                  {"enclosure",
                   {{"url", kArtifactUrl},
                    {"length", artifact.size()},
                    {"sha256", upkit::test::sha256Hex(artifact)}}}};
    json feed = {{"format_version", 1}, {"platform", "linux"}, {"releases", json::array({entry})}};
    return feed.dump();
}

// Everything one orchestrator needs, rooted in a private temp directory.
struct Harness {
    explicit Harness(const std::string& artifact = releaseArchive(),
                     std::shared_ptr<upkit::PlatformInstaller> installerOverride = nullptr) {
        transport->setChunkSize(512);
        transport->setResponse(kFeedUrl, feedFor(artifact));
        transport->setResponse(kArtifactUrl, artifact);

        upkit::test::writeFile(installDir() / "bin/app", "old build");
        fs::permissions(installDir() / "bin/app", fs::perms::owner_all);
        upkit::test::writeFile(installDir() / "lib/libruntime.so", "old runtime");

        settings.feedBaseUrl = kBase;
        settings.currentVersion = upkit::VersionComparator::parse("1.0.0");
        settings.stagingDir = stagingDir();
        settings.installDir = installDir();
        settings.layout.entryPoint = "bin/app";
        settings.layout.requiredComponents = {"lib/libruntime.so"};
        settings.relaunchArgs = {"--updated"};

        installer = installerOverride ? installerOverride : std::make_shared<upkit::ArchiveInstaller>();
    }

    InstallOrchestrator& start() {
        upkit::RetryPolicy policy;
        policy.maxAttempts = 2;
        policy.initialBackoff = 1ms;
        orchestrator = std::make_unique<InstallOrchestrator>(
            settings,
            std::make_shared<upkit::FeedClient>(transport, verifier),
            std::make_shared<upkit::Downloader>(transport, verifier, policy),
            installer, relauncher, verifier);
        orchestrator->subscribe([this](const UpdateEvent& e) { recorder(e); });
        return *orchestrator;
    }

    UpdateState settle() {
        assert(orchestrator->waitUntilSettled(10s));
        return orchestrator->getSessionState().state;
    }

    fs::path stagingDir() const { return root.path() / "staging"; }
    fs::path installDir() const { return root.path() / "install" / "app"; }

    TempDir root;
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    std::shared_ptr<upkit::IntegrityVerifier> verifier = std::make_shared<upkit::IntegrityVerifier>();
    std::shared_ptr<upkit::PlatformInstaller> installer;
    std::shared_ptr<RecordingRelauncher> relauncher = std::make_shared<RecordingRelauncher>();
    upkit::OrchestratorSettings settings;
    Recorder recorder;
    std::unique_ptr<InstallOrchestrator> orchestrator;
};

void endToEnd() {
    Harness h;
    auto& o = h.start();

    assert(!o.proceed());
    assert(!o.install());
    assert(!o.cancel());

    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    auto session = o.getSessionState();
    assert(session.candidate && session.candidate->versionText == "1.0.1");

    assert(o.proceed());
    assert(h.settle() == UpdateState::VERIFIED);
    session = o.getSessionState();
    assert(session.stagedArtifactPath);
    assert(session.stagedArtifactPath->parent_path() == h.stagingDir());
    assert(session.progressFraction == 1.0f);

    assert(o.install());
    assert(h.settle() == UpdateState::RESTART_PENDING);
    assert(upkit::test::readFile(h.installDir() / "VERSION") == "1.0.1");
    assert(!fs::exists(upkit::ArchiveInstaller::backupDir(h.installDir())));

    assert(o.restartNow());
    assert(h.settle() == UpdateState::IDLE);
    assert(h.relauncher->launched.size() == 1);
    assert(h.relauncher->launched[0] == h.installDir() / "bin/app");
    assert(h.relauncher->lastArgs == std::vector<std::string>{"--updated"});

    const std::vector<UpdateState> expected = {
        UpdateState::CHECKING,   UpdateState::UPDATE_AVAILABLE, UpdateState::DOWNLOADING,
        UpdateState::VERIFIED,   UpdateState::INSTALLING,       UpdateState::RESTART_PENDING,
        UpdateState::IDLE,
    };
    assert(h.recorder.snapshot() == expected);
    assert(h.recorder.progressEvents > 0);
    assert(countEntries(h.stagingDir()) == 0);
}

void automaticFlow() {
    Harness h;
    h.settings.autoDownload = true;
    h.settings.autoInstall = true;
    auto& o = h.start();

    assert(o.checkNow());
    assert(h.settle() == UpdateState::RESTART_PENDING);
    assert(upkit::test::readFile(h.installDir() / "VERSION") == "1.0.1");
}

void concurrentChecksAreRejected() {
    Harness h;
    auto& o = h.start();

    h.transport->hold();
    assert(o.checkNow());
    assert(!o.checkNow());
    assert(!o.checkNow());
    h.transport->release();

    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    assert(h.transport->requestCount(kFeedUrl) == 1);
    // Still active: UpdateAvailable waits for the caller.
    assert(!o.checkNow());

    assert(o.dismiss());
    assert(o.getSessionState().state == UpdateState::IDLE);
    assert(!o.proceed());
    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    assert(h.transport->requestCount(kFeedUrl) == 2);
}

void upToDateAndIgnored() {
    {
        Harness h;
        h.settings.currentVersion = upkit::VersionComparator::parse("1.0.1");
        auto& o = h.start();
        assert(o.checkNow());
        assert(h.settle() == UpdateState::IDLE);
        assert(h.recorder.upToDateEvents == 1);
        assert(!o.getSessionState().error);
    }
    {
        Harness h;
        h.settings.ignoredVersions = {"1.0.1"};
        auto& o = h.start();
        assert(o.checkNow());
        assert(h.settle() == UpdateState::IDLE);
        assert(h.recorder.upToDateEvents == 1);
        assert(h.transport->requestCount(kArtifactUrl) == 0);
    }
    {
        Harness h;
        auto& o = h.start();
        assert(!o.checkIfDue(upkit::CheckFrequency::NEVER, 0));
        assert(!o.checkIfDue(upkit::CheckFrequency::DAILY,
                             std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count()));
        assert(h.transport->requestCount(kFeedUrl) == 0);
        assert(o.checkIfDue(upkit::CheckFrequency::DAILY, 0));
        assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    }
}

void feedFailureIsRetryable() {
    Harness h;
    h.transport->setResponse(kFeedUrl, "{ this is not json");
    auto& o = h.start();

    assert(o.checkNow());
    assert(h.settle() == UpdateState::FAILED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::FEED_PARSE);
    assert(upkit::isRetryable(session.error->kind));

    h.transport->setResponse(kFeedUrl, feedFor(releaseArchive()));
    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    assert(!o.getSessionState().error);
}

void cancelMidDownload() {
    Harness h;
    h.transport->setChunkSize(16);
    InstallOrchestrator* target = nullptr;
    h.transport->setOnChunkSent([&](const std::string& url, std::uint64_t sent) {
        if (url == kArtifactUrl && sent == 16) target->cancel();
    });
    auto& o = h.start();
    target = &o;

    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    assert(o.proceed());
    assert(h.settle() == UpdateState::CANCELLED);

    assert(countEntries(h.stagingDir()) == 0);
    assert(upkit::test::readFile(h.installDir() / "bin/app") == "old build");
    const auto states = h.recorder.snapshot();
    assert(states.back() == UpdateState::CANCELLED);

    // A cancelled session does not block the next one.
    h.transport->setOnChunkSent(nullptr);
    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
}

void cancelDuringCheck() {
    Harness h;
    auto& o = h.start();

    h.transport->hold();
    assert(o.checkNow());
    assert(o.cancel());
    h.transport->release();

    assert(h.settle() == UpdateState::CANCELLED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::CANCELLED);
    assert(!session.candidate);
    assert(countEntries(h.stagingDir()) == 0);
    assert(h.transport->requestCount(kArtifactUrl) == 0);

    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
}

// A check started while the updater is being torn down never reaches the
// worker and must end as cancelled rather than failed.
void checkDuringShutdownIsCancelled() {
    Harness h;
    auto& o = h.start();

    // The nested checkNow() notifies on the same thread.
    std::recursive_mutex mutex;
    bool retried = false;
    bool accepted = true;
    upkit::UpdateSession second;
    o.subscribe([&](const UpdateEvent& e) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        if (e.session.id == 1 && e.session.state == UpdateState::CANCELLED && !retried) {
            retried = true;
            accepted = o.checkNow();
        } else if (e.session.id == 2) {
            second = e.session;
        }
    });

    std::atomic<bool> closing{false};
    auto& logger = upkit::Logger::instance();
    logger.setLevel(upkit::LogLevel::DEBUG);
    logger.setSink([&](upkit::LogLevel, const std::string& line) {
        if (line.find("Shutting down TaskRunner") != std::string::npos) closing = true;
    });

    h.transport->hold();
    assert(o.checkNow());
    std::thread teardown([&] { h.orchestrator.reset(); });
    assert(upkit::test::waitFor([&] { return closing.load(); }));
    h.transport->release();
    teardown.join();
    logger.setSink(nullptr);

    assert(retried);
    assert(!accepted);
    assert(second.id == 2);
    assert(second.state == UpdateState::CANCELLED);
    assert(second.error && second.error->kind == ErrorKind::CANCELLED);
    assert(h.transport->requestCount(kFeedUrl) == 1);
}

void corruptDownloadFails() {
    const std::string artifact = releaseArchive();
    Harness h(artifact);
    std::string corrupted = artifact;
    corrupted[corrupted.size() / 2] ^= 0x5a;
    h.transport->setResponse(kArtifactUrl, corrupted);
    auto& o = h.start();

    assert(o.checkNow());
    assert(h.settle() == UpdateState::UPDATE_AVAILABLE);
    assert(o.proceed());
    assert(h.settle() == UpdateState::FAILED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::INTEGRITY);
    assert(countEntries(h.stagingDir()) == 0);
    assert(!o.install());
}

void stagedArtifactIsReverified() {
    auto installer = std::make_shared<ScriptedInstaller>();
    Harness h(releaseArchive(), installer);
    auto& o = h.start();

    assert(o.checkNow());
    h.settle();
    assert(o.proceed());
    assert(h.settle() == UpdateState::VERIFIED);

    const fs::path staged = *o.getSessionState().stagedArtifactPath;
    std::string bytes = upkit::test::readFile(staged);
    bytes[10] ^= 0x01;
    upkit::test::writeFile(staged, bytes);

    assert(o.install());
    assert(h.settle() == UpdateState::FAILED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::INTEGRITY);
    assert(installer->applyCalls == 0);
    assert(!fs::exists(staged));
}

void installFailureRollsBack() {
    {
        auto installer = std::make_shared<ScriptedInstaller>();
        installer->applyOk = false;
        Harness h(releaseArchive(), installer);
        h.settings.autoDownload = true;
        h.settings.autoInstall = true;
        auto& o = h.start();

        assert(o.checkNow());
        assert(h.settle() == UpdateState::FAILED);
        auto session = o.getSessionState();
        assert(session.error && session.error->kind == ErrorKind::INSTALL);
        assert(upkit::isRetryable(session.error->kind));
        assert(installer->rollbackCalls == 1);
        assert(installer->commitCalls == 0);
    }
    {
        auto installer = std::make_shared<ScriptedInstaller>();
        installer->applyOk = false;
        installer->rollbackOk = false;
        Harness h(releaseArchive(), installer);
        h.settings.autoDownload = true;
        h.settings.autoInstall = true;
        auto& o = h.start();

        assert(o.checkNow());
        assert(h.settle() == UpdateState::FAILED);
        auto session = o.getSessionState();
        assert(session.error && session.error->kind == ErrorKind::FATAL);
        assert(!upkit::isRetryable(session.error->kind));
    }
}

void incompleteBuildIsFatal() {
    Harness h(releaseArchive(false));
    h.settings.autoDownload = true;
    h.settings.autoInstall = true;
    auto& o = h.start();

    assert(o.checkNow());
    assert(h.settle() == UpdateState::FAILED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::FATAL);
    assert(h.relauncher->launched.empty());
    // The previous build is back in place.
    assert(upkit::test::readFile(h.installDir() / "bin/app") == "old build");
    assert(countEntries(h.stagingDir()) == 0);
}

void relaunchFailureIsFatal() {
    Harness h;
    h.settings.autoDownload = true;
    h.settings.autoInstall = true;
    h.relauncher->succeed = false;
    auto& o = h.start();

    assert(o.checkNow());
    assert(h.settle() == UpdateState::RESTART_PENDING);
    assert(o.restartNow());
    assert(h.settle() == UpdateState::FAILED);
    auto session = o.getSessionState();
    assert(session.error && session.error->kind == ErrorKind::FATAL);
}

void overlappingDirectoriesAreRejected() {
    Harness h;
    h.settings.stagingDir = h.installDir() / "staging";
    bool rejected = false;
    try {
        h.start();
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
}

}  // namespace

int main() {
    endToEnd();
    automaticFlow();
    concurrentChecksAreRejected();
    upToDateAndIgnored();
    feedFailureIsRetryable();
    cancelMidDownload();
    cancelDuringCheck();
    checkDuringShutdownIsCancelled();
    corruptDownloadFails();
    stagedArtifactIsReverified();
    installFailureRollsBack();
    incompleteBuildIsFatal();
    relaunchFailureIsFatal();
    overlappingDirectoriesAreRejected();
    return 0;
}
