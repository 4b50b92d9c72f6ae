#include "fingerprint.h"

#include <array>

#include <mbedtls/sha256.h>

#include "util.h"

namespace inkshell {

static constexpr std::size_t kFingerprintDigits = 16;
static constexpr const char* kNamePrefix = "ink_";
static constexpr const char* kNameSuffix = ".jpg";

std::string sha256_hex(const std::uint8_t* data, std::size_t len) {
  std::array<unsigned char, 32> digest{};
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  int rc = mbedtls_sha256_starts(&ctx, 0);  // 0 = SHA-256, not SHA-224
  if (rc == 0) rc = mbedtls_sha256_update(&ctx, data, len);
  if (rc == 0) rc = mbedtls_sha256_finish(&ctx, digest.data());
  mbedtls_sha256_free(&ctx);
  if (rc != 0) return {};

  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (unsigned char b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string content_fingerprint(const std::vector<std::uint8_t>& data) {
  std::string full = sha256_hex(data.data(), data.size());
  if (full.size() < kFingerprintDigits) return {};
  return full.substr(0, kFingerprintDigits);
}

std::string fingerprint_filename(const std::string& fingerprint) {
  return std::string(kNamePrefix) + fingerprint + kNameSuffix;
}

bool fingerprint_from_filename(const std::string& name, std::string& fingerprint) {
  const std::string lower = to_lower_ascii(name);
  const std::string prefix = kNamePrefix;
  const std::string suffix = kNameSuffix;
  if (lower.size() != prefix.size() + kFingerprintDigits + suffix.size()) return false;
  if (lower.compare(0, prefix.size(), prefix) != 0) return false;
  if (lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
  std::string fp = lower.substr(prefix.size(), kFingerprintDigits);
  for (char c : fp) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  fingerprint = std::move(fp);
  return true;
}

} // namespace inkshell
