#ifndef UPKIT_VERSION_COMPARATOR_HPP
#define UPKIT_VERSION_COMPARATOR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace upkit {

enum class Channel { STABLE, TEST };

std::string channelName(Channel channel);
// Accepts "stable", "test" and the older "beta" spelling.
std::optional<Channel> parseChannel(const std::string &text);

struct VersionIdentifier {
  std::uint64_t major = 0;
  std::uint64_t minor = 0;
  std::uint64_t patch = 0;
  std::optional<std::string> prerelease;
  std::optional<std::string> buildMetadata; // never affects ordering

  std::string toString() const;
};

class VersionComparator {
public:
  // Throws MalformedVersion unless the text is MAJOR.MINOR.PATCH with an
  // optional "-prerelease" and/or "+build" suffix.
  static VersionIdentifier parse(const std::string &text);
  static std::optional<VersionIdentifier> tryParse(const std::string &text);

  // -1, 0 or 1. A release without a prerelease label outranks every
  // prerelease of the same base. Two prerelease labels compare as plain
  // strings, so "test10" sorts before "test9".
  static int compare(const VersionIdentifier &a, const VersionIdentifier &b);

  static bool isStable(const VersionIdentifier &v) {
    return !v.prerelease.has_value();
  }

  static VersionIdentifier extractBase(const VersionIdentifier &v);

  // Whether `candidate` may be offered to a user running `current` on
  // `channel`.
  static bool isEligible(const VersionIdentifier &current,
                         const VersionIdentifier &candidate, Channel channel);
};

} // namespace upkit

#endif // UPKIT_VERSION_COMPARATOR_HPP
