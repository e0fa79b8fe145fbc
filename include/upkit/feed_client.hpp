#ifndef UPKIT_FEED_CLIENT_HPP
#define UPKIT_FEED_CLIENT_HPP

#include "upkit/http.hpp"
#include "upkit/integrity_verifier.hpp"
#include "upkit/version_comparator.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace upkit {

struct ReleaseCandidate {
  VersionIdentifier version;
  std::string versionText;
  std::string displayVersion;
  std::string downloadUrl;
  std::uint64_t artifactSizeBytes = 0;
  std::optional<std::string> checksumSha256;
  std::optional<std::string> releaseNotesUrl;
  std::optional<std::string> releaseNotes;
  std::optional<std::string> pubDate;
  Channel channel = Channel::STABLE;
};

class FeedClient {
public:
  static constexpr int SUPPORTED_FORMAT_VERSION = 1;
  static constexpr size_t MAX_DOCUMENT_BYTES = 4 * 1024 * 1024;
  static constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};

  FeedClient(std::shared_ptr<Transport> transport,
             std::shared_ptr<const IntegrityVerifier> verifier,
             std::chrono::seconds timeout = DEFAULT_TIMEOUT);

  // <base>/<platform>/<channel>/feed.json
  static std::string feedUrl(const std::string &baseUrl,
                             const std::string &platform, Channel channel);

  // Candidates in document order. Throws InsecureURLError for a non-https
  // feed URL, DownloadError when the document cannot be retrieved,
  // FeedParseError when it cannot be read and CancelledError once `stop` is
  // requested.
  std::vector<ReleaseCandidate>
  fetchCandidates(const std::string &feedUrl, const std::string &platform,
                  std::stop_token stop = {}) const;

  // Bad entries are logged and skipped; only a document-level problem throws
  // FeedParseError.
  std::vector<ReleaseCandidate> parseFeed(const std::string &document,
                                          const std::string &platform) const;

  static std::optional<ReleaseCandidate>
  selectBest(const std::vector<ReleaseCandidate> &candidates,
             const VersionIdentifier &current, Channel channel);

private:
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<const IntegrityVerifier> verifier_;
  std::chrono::seconds timeout_;
};

} // namespace upkit

#endif // UPKIT_FEED_CLIENT_HPP
