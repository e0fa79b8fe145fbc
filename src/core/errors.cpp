#include "upkit/errors.hpp"

namespace upkit {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MALFORMED_VERSION:
    return "MalformedVersion";
  case ErrorKind::FEED_PARSE:
    return "FeedParseError";
  case ErrorKind::INSECURE_URL:
    return "InsecureURLError";
  case ErrorKind::INTEGRITY:
    return "IntegrityError";
  case ErrorKind::DOWNLOAD:
    return "DownloadError";
  case ErrorKind::INSTALL:
    return "InstallError";
  case ErrorKind::FATAL:
    return "Fatal";
  case ErrorKind::CANCELLED:
    return "Cancelled";
  }
  return "Unknown";
}

bool isRetryable(ErrorKind kind) { return kind != ErrorKind::FATAL; }

} // namespace upkit
