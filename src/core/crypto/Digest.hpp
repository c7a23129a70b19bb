#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace safesar {

std::string to_hex(const uint8_t* data, size_t len);

// Lowercase hex SHA-256 of bytes.
std::string sha256_hex(std::string_view bytes);

// Lowercase hex HMAC-SHA256 of message under key.
std::string hmac_sha256_hex(std::string_view key, std::string_view message);

} // namespace safesar
