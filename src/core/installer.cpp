#include "upkit/installer.hpp"
#include "upkit/archive_util.hpp"
#include "upkit/logger.hpp"
#include <unistd.h>

namespace upkit {

namespace fs = std::filesystem;

static fs::path siblingOf(const fs::path &installDir, const char *suffix) {
  fs::path dir = installDir;
  if (!dir.has_filename())
    dir = dir.parent_path(); // "app/" -> "app"
  dir += suffix;
  return dir;
}

fs::path ArchiveInstaller::incomingDir(const fs::path &installDir) {
  return siblingOf(installDir, ".new");
}

fs::path ArchiveInstaller::backupDir(const fs::path &installDir) {
  return siblingOf(installDir, ".old");
}

InstallResult ArchiveInstaller::apply(const fs::path &artifact,
                                      const fs::path &installDir) {
  backupTaken_ = false;
  swapped_ = false;
  const fs::path incoming = incomingDir(installDir);
  const fs::path backup = backupDir(installDir);

  try {
    // Leftovers from an interrupted run.
    fs::remove_all(incoming);
    fs::remove_all(backup);

    std::string error;
    if (!ArchiveUtil::extract(artifact, incoming, error)) {
      fs::remove_all(incoming);
      return InstallResult::failure(error);
    }

    if (fs::exists(installDir)) {
      fs::rename(installDir, backup);
      backupTaken_ = true;
      LOG_DEBUG("Moved current installation to " + backup.string());
    } else if (installDir.has_parent_path()) {
      fs::create_directories(installDir.parent_path());
    }

    fs::rename(incoming, installDir);
    swapped_ = true;
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Install step failed: " + std::string(e.what()));
    std::error_code ec;
    fs::remove_all(incoming, ec);
    return InstallResult::failure(e.what());
  }

  LOG_INFO("Installed " + artifact.filename().string() + " into " +
           installDir.string());
  return InstallResult::success();
}

bool ArchiveInstaller::rollback(const fs::path &installDir) {
  std::error_code ec;
  fs::remove_all(incomingDir(installDir), ec);

  if (!backupTaken_) {
    if (swapped_) {
      // Fresh install: there was nothing before it.
      fs::remove_all(installDir, ec);
      if (ec) {
        LOG_ERROR("Could not remove failed installation: " + ec.message());
        return false;
      }
      swapped_ = false;
    }
    return true;
  }

  const fs::path backup = backupDir(installDir);
  if (!fs::exists(backup, ec)) {
    LOG_ERROR("No backup to restore at " + backup.string());
    return false;
  }

  fs::remove_all(installDir, ec);
  if (ec) {
    LOG_ERROR("Could not remove broken installation: " + ec.message());
    return false;
  }
  fs::rename(backup, installDir, ec);
  if (ec) {
    LOG_ERROR("Could not restore backup: " + ec.message());
    return false;
  }

  backupTaken_ = false;
  swapped_ = false;
  LOG_WARN("Restored previous installation at " + installDir.string());
  return true;
}

void ArchiveInstaller::commit(const fs::path &installDir) {
  std::error_code ec;
  fs::remove_all(backupDir(installDir), ec);
  if (ec)
    LOG_WARN("Could not remove backup: " + ec.message());
  backupTaken_ = false;
  swapped_ = false;
}

VerificationResult checkInstallStructure(const fs::path &installDir,
                                         const InstallLayout &layout) {
  std::error_code ec;
  if (layout.entryPoint.empty())
    return VerificationResult::failure("No entry point configured");

  const fs::path entry = installDir / layout.entryPoint;
  if (!fs::is_regular_file(entry, ec))
    return VerificationResult::failure("Entry point missing: " +
                                       entry.string());
  if (access(entry.c_str(), X_OK) != 0)
    return VerificationResult::failure("Entry point is not executable: " +
                                       entry.string());

  for (const auto &component : layout.requiredComponents) {
    const fs::path path = installDir / component;
    if (!fs::exists(path, ec))
      return VerificationResult::failure("Required component missing: " +
                                         path.string());
  }

  return VerificationResult::success();
}

} // namespace upkit
