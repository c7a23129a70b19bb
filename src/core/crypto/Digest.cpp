#include "Digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace safesar {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  uint8_t hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), hash);
  return to_hex(hash, sizeof(hash));
}

std::string hmac_sha256_hex(std::string_view key, std::string_view message) {
  uint8_t mac[EVP_MAX_MD_SIZE];
  unsigned int macLen = 0;
  // HMAC() wants a non-null key pointer even for zero-length keys.
  static const unsigned char kEmpty = 0;
  const void* keyPtr = key.empty() ? static_cast<const void*>(&kEmpty) : key.data();
  if (!HMAC(EVP_sha256(), keyPtr, static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(message.data()), message.size(),
            mac, &macLen)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return to_hex(mac, macLen);
}

} // namespace safesar
