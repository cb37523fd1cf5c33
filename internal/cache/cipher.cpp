#include "internal/cache/cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace syncore::cache {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx NewCtx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) throw std::runtime_error("Failed to allocate cipher ctx");
  return ctx;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Cipher::Cipher(std::array<uint8_t, kKeySize> key) : key_(key) {
}

std::optional<Cipher> Cipher::FromHex(const std::string& key_hex) {
  if (key_hex.empty()) {
    return std::nullopt;
  }
  if (key_hex.size() != kKeySize * 2) {
    throw util::ValidationError("encryption key must be 64 hex characters");
  }

  std::array<uint8_t, kKeySize> key{};
  for (size_t i = 0; i < kKeySize; ++i) {
    const int hi = HexValue(key_hex[2 * i]);
    const int lo = HexValue(key_hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw util::ValidationError("encryption key is not valid hex");
    }
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return Cipher(key);
}

std::string Cipher::Seal(const std::string& plaintext) const {
  std::string out(kIvSize + plaintext.size() + kTagSize, '\0');
  auto*       iv = reinterpret_cast<unsigned char*>(out.data());
  if (RAND_bytes(iv, static_cast<int>(kIvSize)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }

  auto ctx = NewCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) <= 0) {
    throw std::runtime_error("EncryptInit failed");
  }

  auto* ciphertext = iv + kIvSize;
  int   len        = 0;
  int   outlen     = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len, reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) <= 0) {
    throw std::runtime_error("EncryptUpdate failed");
  }
  outlen = len;

  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + outlen, &len) <= 0) {
    throw std::runtime_error("EncryptFinal failed");
  }
  outlen += len;

  // tag follows the ciphertext
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), ciphertext + outlen) <= 0) {
    throw std::runtime_error("GetTag failed");
  }

  out.resize(kIvSize + static_cast<size_t>(outlen) + kTagSize);
  return out;
}

std::string Cipher::Open(const std::string& sealed) const {
  if (sealed.size() < kIvSize + kTagSize) {
    throw std::runtime_error("Ciphertext too short");
  }

  const auto* iv             = reinterpret_cast<const unsigned char*>(sealed.data());
  const auto* ciphertext     = iv + kIvSize;
  const auto  ciphertext_len = sealed.size() - kIvSize - kTagSize;
  const auto* tag            = ciphertext + ciphertext_len;

  auto ctx = NewCtx();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) <= 0) {
    throw std::runtime_error("DecryptInit failed");
  }

  std::string plaintext(ciphertext_len, '\0');
  int         len    = 0;
  int         outlen = 0;
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len, ciphertext, static_cast<int>(ciphertext_len)) <=
      0) {
    throw std::runtime_error("DecryptUpdate failed");
  }
  outlen = len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), const_cast<unsigned char*>(tag)) <= 0) {
    throw std::runtime_error("SetTag failed");
  }

  // authentication check
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + outlen, &len) <= 0) {
    throw std::runtime_error("Decryption failed: authentication error");
  }
  outlen += len;

  plaintext.resize(static_cast<size_t>(outlen));
  return plaintext;
}

std::string Sha256Hex(const std::string& data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(SHA256_DIGEST_LENGTH * 2);
  for (unsigned char byte : hash) {
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

} // namespace syncore::cache
