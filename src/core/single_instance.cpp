#include "upkit/single_instance.hpp"
#include "upkit/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace upkit {

SingleInstance::SingleInstance(const std::filesystem::path &lockPath)
    : lockPath_(lockPath.string()) {}

SingleInstance::~SingleInstance() {
  if (lockFd_ != -1) {
    flock(lockFd_, LOCK_UN);
    close(lockFd_);
    lockFd_ = -1;
  }
}

bool SingleInstance::isPrimary() {
  if (lockFd_ != -1)
    return true;

  lockFd_ = open(lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lockFd_ == -1) {
    LOG_ERROR("Failed to open lock file: " + lockPath_ + " (" +
              strerror(errno) + ")");
    return false;
  }

  if (flock(lockFd_, LOCK_EX | LOCK_NB) == -1) {
    int err = errno;
    close(lockFd_);
    lockFd_ = -1;
    if (err != EWOULDBLOCK) {
      LOG_ERROR("Failed to flock " + lockPath_ + ": " + strerror(err));
    }
    return false;
  }

  // Record the holder so a stuck lock can be traced to a process.
  if (ftruncate(lockFd_, 0) == 0) {
    std::string pid = std::to_string(getpid()) + "\n";
    if (write(lockFd_, pid.data(), pid.size()) < 0) {
      LOG_DEBUG("Could not record pid in " + lockPath_);
    }
  }
  return true;
}

} // namespace upkit
