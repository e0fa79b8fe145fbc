#ifndef UPKIT_INTEGRITY_VERIFIER_HPP
#define UPKIT_INTEGRITY_VERIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace upkit {

// Every integrity check reports through this value; none of them throw.
struct VerificationResult {
  bool ok = false;
  std::optional<std::string> error;

  static VerificationResult success() { return {true, std::nullopt}; }
  static VerificationResult failure(const std::string &error) {
    return {false, error};
  }
};

// Out-of-band artifact signature check. No scheme ships today; trust comes
// from HTTPS plus the published checksum.
class SignatureScheme {
public:
  virtual ~SignatureScheme() = default;
  virtual std::string name() const = 0;
  virtual VerificationResult verify(const std::filesystem::path &file,
                                    const std::string &signature) const = 0;
};

class IntegrityVerifier {
public:
  static constexpr std::size_t CHUNK_SIZE = 1024 * 1024;

  IntegrityVerifier() = default;
  explicit IntegrityVerifier(std::shared_ptr<const SignatureScheme> scheme)
      : signatureScheme_(std::move(scheme)) {}

  // Fails unless the URL parses, uses https and names a host.
  VerificationResult verifyTransport(const std::string &url) const;

  // Streams the file through SHA-256 in CHUNK_SIZE reads and compares the
  // digest against `expectedHex` in constant time.
  VerificationResult verifyChecksum(const std::filesystem::path &file,
                                    const std::string &expectedHex) const;

  VerificationResult verifySize(const std::filesystem::path &file,
                                std::uint64_t expectedBytes) const;

  VerificationResult verifySignature(const std::filesystem::path &file,
                                     const std::string &signature) const;

  bool hasSignatureScheme() const { return signatureScheme_ != nullptr; }

  static bool isSha256Hex(const std::string &value);

private:
  std::shared_ptr<const SignatureScheme> signatureScheme_;
};

} // namespace upkit

#endif // UPKIT_INTEGRITY_VERIFIER_HPP
