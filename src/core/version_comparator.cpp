#include "upkit/version_comparator.hpp"
#include "upkit/errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace upkit {

std::string channelName(Channel channel) {
  return channel == Channel::TEST ? "test" : "stable";
}

std::optional<Channel> parseChannel(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "stable")
    return Channel::STABLE;
  if (lower == "test" || lower == "beta")
    return Channel::TEST;
  return std::nullopt;
}

std::string VersionIdentifier::toString() const {
  std::string out = std::to_string(major) + "." + std::to_string(minor) + "." +
                    std::to_string(patch);
  if (prerelease)
    out += "-" + *prerelease;
  if (buildMetadata)
    out += "+" + *buildMetadata;
  return out;
}

static bool parseComponent(const std::string &text, std::uint64_t &out) {
  if (text.empty())
    return false;
  if (!std::all_of(text.begin(), text.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

static bool isLabelChar(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '.' || c == '-';
}

VersionIdentifier VersionComparator::parse(const std::string &text) {
  VersionIdentifier v;
  std::string rest = text;

  // Build metadata is split off first so "1.0.0+build-5" has no prerelease.
  auto plus = rest.find('+');
  if (plus != std::string::npos) {
    // A bare trailing "+" carries no metadata.
    std::string build = rest.substr(plus + 1);
    if (!build.empty())
      v.buildMetadata = build;
    rest = rest.substr(0, plus);
  }

  auto dash = rest.find('-');
  if (dash != std::string::npos) {
    std::string label = rest.substr(dash + 1);
    if (label.empty() || !std::all_of(label.begin(), label.end(), isLabelChar))
      throw MalformedVersion("Invalid prerelease label in version: " + text);
    v.prerelease = label;
    rest = rest.substr(0, dash);
  }

  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    auto dot = rest.find('.', start);
    parts.push_back(rest.substr(start, dot - start));
    if (dot == std::string::npos)
      break;
    start = dot + 1;
  }

  if (parts.size() != 3 || !parseComponent(parts[0], v.major) ||
      !parseComponent(parts[1], v.minor) ||
      !parseComponent(parts[2], v.patch)) {
    throw MalformedVersion("Invalid version format: " + text);
  }

  return v;
}

std::optional<VersionIdentifier>
VersionComparator::tryParse(const std::string &text) {
  try {
    return parse(text);
  } catch (const MalformedVersion &) {
    return std::nullopt;
  }
}

int VersionComparator::compare(const VersionIdentifier &a,
                               const VersionIdentifier &b) {
  if (a.major != b.major)
    return a.major < b.major ? -1 : 1;
  if (a.minor != b.minor)
    return a.minor < b.minor ? -1 : 1;
  if (a.patch != b.patch)
    return a.patch < b.patch ? -1 : 1;

  if (!a.prerelease && !b.prerelease)
    return 0;
  if (!a.prerelease)
    return 1;
  if (!b.prerelease)
    return -1;

  int cmp = a.prerelease->compare(*b.prerelease);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

VersionIdentifier VersionComparator::extractBase(const VersionIdentifier &v) {
  VersionIdentifier base;
  base.major = v.major;
  base.minor = v.minor;
  base.patch = v.patch;
  return base;
}

bool VersionComparator::isEligible(const VersionIdentifier &current,
                                   const VersionIdentifier &candidate,
                                   Channel channel) {
  // Stable users never receive test builds.
  if (channel == Channel::STABLE && !isStable(candidate))
    return false;

  int baseCmp = compare(extractBase(candidate), extractBase(current));
  if (baseCmp > 0)
    return true;
  if (baseCmp == 0)
    return compare(candidate, current) > 0;
  return false;
}

} // namespace upkit
