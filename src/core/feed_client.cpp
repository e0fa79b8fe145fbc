#include "upkit/feed_client.hpp"
#include "upkit/errors.hpp"
#include "upkit/logger.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace upkit {

using json = nlohmann::json;

FeedClient::FeedClient(std::shared_ptr<Transport> transport,
                       std::shared_ptr<const IntegrityVerifier> verifier,
                       std::chrono::seconds timeout)
    : transport_(std::move(transport)), verifier_(std::move(verifier)),
      timeout_(timeout) {}

std::string FeedClient::feedUrl(const std::string &baseUrl,
                                const std::string &platform, Channel channel) {
  std::string base = baseUrl;
  while (!base.empty() && base.back() == '/')
    base.pop_back();
  return base + "/" + platform + "/" + channelName(channel) + "/feed.json";
}

std::vector<ReleaseCandidate>
FeedClient::fetchCandidates(const std::string &feedUrl,
                            const std::string &platform,
                            std::stop_token stop) const {
  auto transport = verifier_->verifyTransport(feedUrl);
  if (!transport.ok) {
    throw InsecureURLError("Feed URL rejected: " +
                           transport.error.value_or(feedUrl));
  }

  if (stop.stop_requested())
    throw CancelledError("Update check cancelled");

  LOG_INFO("Fetching update feed: " + feedUrl);
  std::string document;
  bool tooLarge = false;
  try {
    transport_->get(feedUrl, timeout_,
                    [&](const char *data, size_t size, std::uint64_t) {
                      if (stop.stop_requested())
                        return false;
                      if (document.size() + size > MAX_DOCUMENT_BYTES) {
                        tooLarge = true;
                        return false;
                      }
                      document.append(data, size);
                      return true;
                    });
  } catch (const CancelledError &) {
    // The transport reports our own abort as a cancellation; the size cap
    // is a parse failure instead.
    if (tooLarge)
      throw FeedParseError("Feed document exceeds " +
                           std::to_string(MAX_DOCUMENT_BYTES) + " bytes");
    throw CancelledError("Update check cancelled");
  }
  if (stop.stop_requested())
    throw CancelledError("Update check cancelled");

  LOG_DEBUG("Fetched feed: " + std::to_string(document.size()) + " bytes");
  return parseFeed(document, platform);
}

static std::optional<ReleaseCandidate>
parseEntry(const json &entry, size_t index, const IntegrityVerifier &verifier) {
  const std::string where = "Feed entry #" + std::to_string(index);

  if (!entry.is_object()) {
    LOG_WARN(where + " skipped: not an object");
    return std::nullopt;
  }

  if (!entry.contains("version") || !entry["version"].is_string()) {
    LOG_WARN(where + " skipped: missing version");
    return std::nullopt;
  }
  std::string versionText = entry["version"].get<std::string>();

  // Build numbers such as "202512181304" are not release versions.
  if (!versionText.empty() &&
      std::all_of(versionText.begin(), versionText.end(),
                  [](unsigned char c) { return std::isdigit(c); })) {
    LOG_DEBUG(where + " skipped: '" + versionText + "' is a build number");
    return std::nullopt;
  }

  auto version = VersionComparator::tryParse(versionText);
  if (!version) {
    LOG_WARN(where + " skipped: malformed version '" + versionText + "'");
    return std::nullopt;
  }

  if (!entry.contains("enclosure") || !entry["enclosure"].is_object()) {
    LOG_WARN(where + " (" + versionText + ") skipped: missing enclosure");
    return std::nullopt;
  }
  const json &enclosure = entry["enclosure"];

  if (!enclosure.contains("url") || !enclosure["url"].is_string()) {
    LOG_WARN(where + " (" + versionText + ") skipped: missing download URL");
    return std::nullopt;
  }
  std::string url = enclosure["url"].get<std::string>();
  auto transport = verifier.verifyTransport(url);
  if (!transport.ok) {
    LOG_WARN(where + " (" + versionText + ") skipped: " +
             transport.error.value_or("insecure download URL"));
    return std::nullopt;
  }

  if (!enclosure.contains("length") ||
      !enclosure["length"].is_number_unsigned()) {
    LOG_WARN(where + " (" + versionText +
             ") skipped: enclosure length must be a non-negative integer");
    return std::nullopt;
  }

  ReleaseCandidate candidate;
  candidate.version = *version;
  candidate.versionText = versionText;
  candidate.displayVersion = versionText;
  if (entry.contains("display_version") && entry["display_version"].is_string())
    candidate.displayVersion = entry["display_version"].get<std::string>();
  candidate.downloadUrl = url;
  candidate.artifactSizeBytes = enclosure["length"].get<std::uint64_t>();
  candidate.channel =
      VersionComparator::isStable(*version) ? Channel::STABLE : Channel::TEST;

  if (enclosure.contains("sha256") && enclosure["sha256"].is_string()) {
    std::string checksum = enclosure["sha256"].get<std::string>();
    std::transform(checksum.begin(), checksum.end(), checksum.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (IntegrityVerifier::isSha256Hex(checksum)) {
      candidate.checksumSha256 = checksum;
    } else {
      LOG_WARN(where + " (" + versionText +
               "): ignoring sha256 value that is not a SHA-256 digest");
    }
  }

  if (entry.contains("release_notes_url") &&
      entry["release_notes_url"].is_string()) {
    std::string notesUrl = entry["release_notes_url"].get<std::string>();
    if (verifier.verifyTransport(notesUrl).ok) {
      candidate.releaseNotesUrl = notesUrl;
    } else {
      LOG_DEBUG(where + ": dropping insecure release notes link");
    }
  }
  if (entry.contains("release_notes") && entry["release_notes"].is_string())
    candidate.releaseNotes = entry["release_notes"].get<std::string>();
  if (entry.contains("pub_date") && entry["pub_date"].is_string())
    candidate.pubDate = entry["pub_date"].get<std::string>();

  return candidate;
}

std::vector<ReleaseCandidate>
FeedClient::parseFeed(const std::string &document,
                      const std::string &platform) const {
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error &e) {
    throw FeedParseError("Feed is not valid JSON: " + std::string(e.what()));
  }

  if (!j.is_object())
    throw FeedParseError("Feed document must be a JSON object");

  if (!j.contains("format_version") ||
      !j["format_version"].is_number_integer()) {
    throw FeedParseError("Feed document has no format_version");
  }
  const json &format = j["format_version"];
  // Read at full width so large values cannot wrap onto a supported one.
  bool supported =
      format.is_number_unsigned()
          ? format.get<std::uint64_t>() ==
                static_cast<std::uint64_t>(SUPPORTED_FORMAT_VERSION)
          : format.get<std::int64_t>() ==
                static_cast<std::int64_t>(SUPPORTED_FORMAT_VERSION);
  if (!supported)
    throw FeedParseError("Unsupported feed format_version " + format.dump());

  if (j.contains("platform")) {
    if (!j["platform"].is_string() ||
        j["platform"].get<std::string>() != platform) {
      throw FeedParseError("Feed is not for platform '" + platform + "'");
    }
  }

  if (!j.contains("releases") || !j["releases"].is_array())
    throw FeedParseError("Feed document has no releases array");

  std::vector<ReleaseCandidate> candidates;
  const json &releases = j["releases"];
  for (size_t i = 0; i < releases.size(); ++i) {
    auto candidate = parseEntry(releases[i], i, *verifier_);
    if (candidate)
      candidates.push_back(std::move(*candidate));
  }

  LOG_INFO("Parsed " + std::to_string(candidates.size()) + " of " +
           std::to_string(releases.size()) + " feed entries");
  return candidates;
}

std::optional<ReleaseCandidate>
FeedClient::selectBest(const std::vector<ReleaseCandidate> &candidates,
                       const VersionIdentifier &current, Channel channel) {
  const ReleaseCandidate *best = nullptr;
  for (const auto &candidate : candidates) {
    if (!VersionComparator::isEligible(current, candidate.version, channel)) {
      LOG_DEBUG("Not eligible: " + candidate.versionText + " (current " +
                current.toString() + ", channel " + channelName(channel) +
                ")");
      continue;
    }
    if (!best ||
        VersionComparator::compare(candidate.version, best->version) > 0) {
      best = &candidate;
    }
  }

  if (!best)
    return std::nullopt;
  return *best;
}

} // namespace upkit
