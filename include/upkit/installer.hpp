#ifndef UPKIT_INSTALLER_HPP
#define UPKIT_INSTALLER_HPP

#include "upkit/integrity_verifier.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace upkit {

struct InstallResult {
  bool ok = false;
  std::optional<std::string> error;

  static InstallResult success() { return {true, std::nullopt}; }
  static InstallResult failure(const std::string &error) {
    return {false, error};
  }
};

// Replaces the current installation with a staged artifact. Implementations
// must leave either the old or the new tree in place, never a mix.
class PlatformInstaller {
public:
  virtual ~PlatformInstaller() = default;

  // Applying the same artifact twice yields the same installation.
  virtual InstallResult apply(const std::filesystem::path &artifact,
                              const std::filesystem::path &installDir) = 0;

  // Best effort. Returns false when the previous installation could not be
  // restored.
  virtual bool rollback(const std::filesystem::path &installDir) = 0;

  // Drops whatever apply() kept around for rollback.
  virtual void commit(const std::filesystem::path &installDir) = 0;
};

// Linux/portable mechanism: the artifact is an archive holding the whole
// application tree. The tree is unpacked next to the installation and
// swapped in with two renames.
class ArchiveInstaller : public PlatformInstaller {
public:
  InstallResult apply(const std::filesystem::path &artifact,
                      const std::filesystem::path &installDir) override;
  bool rollback(const std::filesystem::path &installDir) override;
  void commit(const std::filesystem::path &installDir) override;

  static std::filesystem::path
  incomingDir(const std::filesystem::path &installDir);
  static std::filesystem::path
  backupDir(const std::filesystem::path &installDir);

private:
  bool backupTaken_ = false;
  bool swapped_ = false;
};

// What a runnable installation must contain, relative to its root.
struct InstallLayout {
  std::filesystem::path entryPoint;
  std::vector<std::filesystem::path> requiredComponents;
};

// Post-install check: the entry point is an executable regular file and
// every required component exists.
VerificationResult checkInstallStructure(const std::filesystem::path &installDir,
                                         const InstallLayout &layout);

} // namespace upkit

#endif // UPKIT_INSTALLER_HPP
