#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace syncore::cache {

/*
  AES-256-GCM envelope for sensitive cache values.

  Sealed layout: iv (12) || ciphertext || tag (16). Open() throws on any
  authentication failure; the cache treats that exactly like a checksum
  mismatch.
*/
class Cipher {
 public:
  static constexpr size_t kKeySize = 32;
  static constexpr size_t kIvSize  = 12;
  static constexpr size_t kTagSize = 16;

  explicit Cipher(std::array<uint8_t, kKeySize> key);

  // 64 hex characters. Empty input yields nullopt (encryption disabled).
  static std::optional<Cipher> FromHex(const std::string& key_hex);

  std::string Seal(const std::string& plaintext) const;
  std::string Open(const std::string& sealed) const;

 private:
  std::array<uint8_t, kKeySize> key_;
};

// Lowercase hex SHA-256 of `data`.
std::string Sha256Hex(const std::string& data);

} // namespace syncore::cache
