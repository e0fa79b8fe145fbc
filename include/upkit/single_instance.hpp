#ifndef UPKIT_SINGLE_INSTANCE_HPP
#define UPKIT_SINGLE_INSTANCE_HPP

#include <filesystem>
#include <string>

namespace upkit {

// Exclusive advisory lock on a file, held for the lifetime of the object.
class SingleInstance {
public:
  explicit SingleInstance(const std::filesystem::path &lockPath);
  ~SingleInstance();

  // Returns true if this is the primary instance (acquired the lock).
  // Returns false if another instance is already running.
  bool isPrimary();

  SingleInstance(const SingleInstance &) = delete;
  SingleInstance &operator=(const SingleInstance &) = delete;

private:
  std::string lockPath_;
  int lockFd_ = -1;
};

} // namespace upkit

#endif // UPKIT_SINGLE_INSTANCE_HPP
