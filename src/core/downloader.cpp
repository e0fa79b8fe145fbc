#include "upkit/downloader.hpp"
#include "upkit/errors.hpp"
#include "upkit/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <fstream>
#include <mutex>

namespace upkit {

std::chrono::milliseconds RetryPolicy::backoffAfter(int attempt) const {
  double delay = static_cast<double>(initialBackoff.count());
  for (int i = 1; i < attempt; ++i)
    delay *= multiplier;
  auto capped = std::min<double>(delay, static_cast<double>(maxBackoff.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

Downloader::Downloader(std::shared_ptr<Transport> transport,
                       std::shared_ptr<const IntegrityVerifier> verifier,
                       RetryPolicy policy, std::chrono::seconds timeout)
    : transport_(std::move(transport)), verifier_(std::move(verifier)),
      policy_(policy), timeout_(timeout) {
  if (policy_.maxAttempts < 1)
    policy_.maxAttempts = 1;
}

std::string Downloader::artifactFileName(const std::string &url) {
  std::string path = url.substr(0, url.find_first_of("?#"));
  auto slash = path.find_last_of('/');
  std::string name =
      slash == std::string::npos ? path : path.substr(slash + 1);
  auto scheme = path.find("://");
  // "https://host" has no path segment at all
  if (name.empty() || name == "." || name == ".." ||
      (scheme != std::string::npos && slash != std::string::npos &&
       slash < scheme + 3)) {
    return "update_artifact";
  }
  return name;
}

// Sleeps for `delay` unless a stop is requested first. Returns false when
// woken by the stop request.
static bool waitForRetry(std::chrono::milliseconds delay,
                         std::stop_token stop) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(m);
  cv.wait_for(lock, stop, delay, [] { return false; });
  return !stop.stop_requested();
}

// Local disk failures are not helped by retrying the network.
class StagingWriteError : public DownloadError {
public:
  using DownloadError::DownloadError;
};

static void removeQuietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec)
    LOG_WARN("Could not remove " + path.string() + ": " + ec.message());
}

void Downloader::fetchOnce(const ReleaseCandidate &candidate,
                           const std::filesystem::path &partPath,
                           const ProgressCallback &onProgress,
                           std::stop_token stop) const {
  std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
  if (!out)
    throw StagingWriteError("Cannot write " + partPath.string() + ": " +
                            std::strerror(errno));

  std::uint64_t received = 0;
  bool writeFailed = false;
  transport_->get(
      candidate.downloadUrl, timeout_,
      [&](const char *data, size_t size, std::uint64_t announced) {
        if (stop.stop_requested())
          return false;
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
          writeFailed = true;
          return false;
        }
        received += size;
        if (onProgress) {
          std::uint64_t total = candidate.artifactSizeBytes > 0
                                    ? candidate.artifactSizeBytes
                                    : announced;
          float fraction =
              total > 0 ? std::min(1.0f, static_cast<float>(received) /
                                             static_cast<float>(total))
                        : 0.0f;
          onProgress(fraction, received, total);
        }
        return true;
      });

  out.close();
  if (writeFailed || !out)
    throw StagingWriteError("Failed writing " + partPath.string());
}

std::filesystem::path
Downloader::stage(const ReleaseCandidate &candidate,
                  const std::filesystem::path &destinationDir,
                  const ProgressCallback &onProgress,
                  std::stop_token stop) const {
  auto transport = verifier_->verifyTransport(candidate.downloadUrl);
  if (!transport.ok)
    throw InsecureURLError("Download URL rejected: " +
                           transport.error.value_or(candidate.downloadUrl));

  std::error_code ec;
  std::filesystem::create_directories(destinationDir, ec);
  if (ec)
    throw DownloadError("Cannot create staging directory " +
                        destinationDir.string() + ": " + ec.message());

  std::string fileName = artifactFileName(candidate.downloadUrl);
  std::filesystem::path finalPath = destinationDir / fileName;
  std::filesystem::path partPath = destinationDir / (fileName + ".part");

  LOG_INFO("Downloading " + candidate.versionText + " from " +
           candidate.downloadUrl);

  for (int attempt = 1;; ++attempt) {
    if (stop.stop_requested()) {
      removeQuietly(partPath);
      throw CancelledError("Download cancelled");
    }

    try {
      fetchOnce(candidate, partPath, onProgress, stop);
      break;
    } catch (const CancelledError &) {
      removeQuietly(partPath);
      // The transport cannot tell a write failure from a cancel; only a
      // real stop request is a cancellation.
      if (stop.stop_requested())
        throw;
      throw DownloadError("Failed writing " + partPath.string());
    } catch (const StagingWriteError &e) {
      removeQuietly(partPath);
      LOG_ERROR(e.what());
      throw;
    } catch (const DownloadError &e) {
      removeQuietly(partPath);
      if (attempt >= policy_.maxAttempts) {
        LOG_ERROR("Download failed after " + std::to_string(attempt) +
                  " attempt(s): " + e.what());
        throw;
      }
      auto delay = policy_.backoffAfter(attempt);
      LOG_WARN("Download attempt " + std::to_string(attempt) + " failed (" +
               e.what() + "), retrying in " + std::to_string(delay.count()) +
               "ms");
      if (!waitForRetry(delay, stop))
        throw CancelledError("Download cancelled");
    } catch (...) {
      removeQuietly(partPath);
      throw;
    }
  }

  // The feed length is authoritative, even when it says 0.
  auto size = verifier_->verifySize(partPath, candidate.artifactSizeBytes);
  if (!size.ok) {
    removeQuietly(partPath);
    LOG_ERROR(*size.error);
    throw IntegrityError(*size.error);
  }

  if (candidate.checksumSha256) {
    auto checksum = verifier_->verifyChecksum(partPath, *candidate.checksumSha256);
    if (!checksum.ok) {
      removeQuietly(partPath);
      LOG_ERROR(*checksum.error);
      throw IntegrityError(*checksum.error);
    }
    LOG_INFO("Checksum verified for " + fileName);
  } else {
    LOG_WARN("No checksum published for " + candidate.versionText +
             ", relying on transport security only");
  }

  std::filesystem::rename(partPath, finalPath, ec);
  if (ec) {
    removeQuietly(partPath);
    throw DownloadError("Cannot move artifact into place: " + ec.message());
  }

  LOG_INFO("Staged " + finalPath.string());
  return finalPath;
}

} // namespace upkit
