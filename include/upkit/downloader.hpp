#ifndef UPKIT_DOWNLOADER_HPP
#define UPKIT_DOWNLOADER_HPP

#include "upkit/feed_client.hpp"
#include "upkit/http.hpp"
#include "upkit/integrity_verifier.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace upkit {

struct RetryPolicy {
  int maxAttempts = 3;
  std::chrono::milliseconds initialBackoff{500};
  double multiplier = 2.0;
  std::chrono::milliseconds maxBackoff{8000};

  // Delay before attempt `attempt` + 1 (attempts count from 1).
  std::chrono::milliseconds backoffAfter(int attempt) const;
};

class Downloader {
public:
  using ProgressCallback = std::function<void(
      float fraction, std::uint64_t receivedBytes, std::uint64_t totalBytes)>;

  Downloader(std::shared_ptr<Transport> transport,
             std::shared_ptr<const IntegrityVerifier> verifier,
             RetryPolicy policy = {},
             std::chrono::seconds timeout = std::chrono::seconds(10));

  // Downloads the candidate's artifact into `destinationDir` and returns the
  // path of the verified file. Nothing is left behind on failure: partial
  // and corrupt files are removed before the error propagates.
  //
  // Throws DownloadError once the retry budget is spent, IntegrityError on a
  // size or checksum mismatch and CancelledError once `stop` is requested.
  std::filesystem::path stage(const ReleaseCandidate &candidate,
                              const std::filesystem::path &destinationDir,
                              const ProgressCallback &onProgress = nullptr,
                              std::stop_token stop = {}) const;

  // Last path segment of the URL without query or fragment.
  static std::string artifactFileName(const std::string &url);

private:
  void fetchOnce(const ReleaseCandidate &candidate,
                 const std::filesystem::path &partPath,
                 const ProgressCallback &onProgress,
                 std::stop_token stop) const;

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<const IntegrityVerifier> verifier_;
  RetryPolicy policy_;
  std::chrono::seconds timeout_;
};

} // namespace upkit

#endif // UPKIT_DOWNLOADER_HPP
