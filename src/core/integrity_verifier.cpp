#include "upkit/integrity_verifier.hpp"
#include "upkit/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <curl/curl.h>
#include <fstream>
#include <iomanip>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <sstream>
#include <vector>

namespace upkit {

namespace {

constexpr size_t SHA256_BYTES = 32;

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string toHex(const unsigned char *data, size_t len) {
  std::stringstream ss;
  for (size_t i = 0; i < len; ++i) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

} // namespace

bool IntegrityVerifier::isSha256Hex(const std::string &value) {
  if (value.size() != SHA256_BYTES * 2)
    return false;
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isxdigit(c); });
}

VerificationResult
IntegrityVerifier::verifyTransport(const std::string &url) const {
  CURLU *handle = curl_url();
  if (!handle)
    return VerificationResult::failure("Failed to allocate URL parser");

  if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    curl_url_cleanup(handle);
    return VerificationResult::failure("Invalid URL: " + url);
  }

  std::string scheme;
  std::string host;
  char *part = nullptr;
  if (curl_url_get(handle, CURLUPART_SCHEME, &part, 0) == CURLUE_OK && part) {
    scheme = toLower(part);
    curl_free(part);
    part = nullptr;
  }
  if (curl_url_get(handle, CURLUPART_HOST, &part, 0) == CURLUE_OK && part) {
    host = part;
    curl_free(part);
  }
  curl_url_cleanup(handle);

  if (scheme != "https") {
    return VerificationResult::failure(
        "URL must use HTTPS, got: " +
        (scheme.empty() ? std::string("missing scheme") : scheme));
  }
  if (host.empty())
    return VerificationResult::failure("URL is missing a host: " + url);

  return VerificationResult::success();
}

VerificationResult
IntegrityVerifier::verifyChecksum(const std::filesystem::path &file,
                                  const std::string &expectedHex) const {
  std::string expected = toLower(trim(expectedHex));
  if (expected.empty())
    return VerificationResult::failure("Missing expected checksum");
  if (!isSha256Hex(expected)) {
    return VerificationResult::failure(
        "Expected checksum is not a valid SHA-256 hex string");
  }

  std::ifstream in(file, std::ios::binary);
  if (!in)
    return VerificationResult::failure("File not found: " + file.string());

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    return VerificationResult::failure("Failed to initialise SHA-256 digest");
  }

  std::vector<char> buffer(CHUNK_SIZE);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(got)) != 1) {
      EVP_MD_CTX_free(ctx);
      return VerificationResult::failure("SHA-256 update failed");
    }
  }
  if (in.bad()) {
    EVP_MD_CTX_free(ctx);
    return VerificationResult::failure("Read error while hashing " +
                                       file.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  int finalOk = EVP_DigestFinal_ex(ctx, digest, &digestLen);
  EVP_MD_CTX_free(ctx);
  if (finalOk != 1 || digestLen != SHA256_BYTES)
    return VerificationResult::failure("SHA-256 finalisation failed");

  std::array<unsigned char, SHA256_BYTES> expectedBytes{};
  for (size_t i = 0; i < SHA256_BYTES; ++i) {
    expectedBytes[i] = static_cast<unsigned char>(
        (hexValue(expected[2 * i]) << 4) | hexValue(expected[2 * i + 1]));
  }

  if (CRYPTO_memcmp(digest, expectedBytes.data(), SHA256_BYTES) != 0) {
    return VerificationResult::failure("Checksum mismatch: expected " +
                                       expected + ", got " +
                                       toHex(digest, digestLen));
  }
  return VerificationResult::success();
}

VerificationResult
IntegrityVerifier::verifySize(const std::filesystem::path &file,
                              std::uint64_t expectedBytes) const {
  std::error_code ec;
  auto actual = std::filesystem::file_size(file, ec);
  if (ec)
    return VerificationResult::failure("File not found: " + file.string());
  if (actual != expectedBytes) {
    return VerificationResult::failure(
        "File size mismatch: expected " + std::to_string(expectedBytes) +
        ", got " + std::to_string(actual));
  }
  return VerificationResult::success();
}

VerificationResult
IntegrityVerifier::verifySignature(const std::filesystem::path &file,
                                   const std::string &signature) const {
  if (!signatureScheme_) {
    return VerificationResult::failure(
        "No signature scheme configured; artifacts are trusted via HTTPS "
        "and checksum");
  }
  auto result = signatureScheme_->verify(file, signature);
  if (!result.ok) {
    LOG_WARN("Signature check (" + signatureScheme_->name() + ") failed for " +
             file.string() + ": " + result.error.value_or("unknown error"));
  }
  return result;
}

} // namespace upkit
