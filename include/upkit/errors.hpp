#ifndef UPKIT_ERRORS_HPP
#define UPKIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace upkit {

enum class ErrorKind {
  MALFORMED_VERSION,
  FEED_PARSE,
  INSECURE_URL,
  INTEGRITY,
  DOWNLOAD,
  INSTALL,
  FATAL,
  CANCELLED
};

// Stable name used in logs and by the CLI ("FeedParseError", ...)
const char *errorKindName(ErrorKind kind);

// Fatal errors need the user to reinstall by hand; everything else may be
// retried with a fresh check.
bool isRetryable(ErrorKind kind);

class UpdateError : public std::runtime_error {
public:
  UpdateError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class MalformedVersion : public UpdateError {
public:
  explicit MalformedVersion(const std::string &message)
      : UpdateError(ErrorKind::MALFORMED_VERSION, message) {}
};

class FeedParseError : public UpdateError {
public:
  explicit FeedParseError(const std::string &message)
      : UpdateError(ErrorKind::FEED_PARSE, message) {}
};

class InsecureURLError : public UpdateError {
public:
  explicit InsecureURLError(const std::string &message)
      : UpdateError(ErrorKind::INSECURE_URL, message) {}
};

class IntegrityError : public UpdateError {
public:
  explicit IntegrityError(const std::string &message)
      : UpdateError(ErrorKind::INTEGRITY, message) {}
};

class DownloadError : public UpdateError {
public:
  explicit DownloadError(const std::string &message)
      : UpdateError(ErrorKind::DOWNLOAD, message) {}
};

class InstallError : public UpdateError {
public:
  explicit InstallError(const std::string &message)
      : UpdateError(ErrorKind::INSTALL, message) {}
};

class FatalError : public UpdateError {
public:
  explicit FatalError(const std::string &message)
      : UpdateError(ErrorKind::FATAL, message) {}
};

class CancelledError : public UpdateError {
public:
  explicit CancelledError(const std::string &message = "Operation cancelled")
      : UpdateError(ErrorKind::CANCELLED, message) {}
};

} // namespace upkit

#endif // UPKIT_ERRORS_HPP
