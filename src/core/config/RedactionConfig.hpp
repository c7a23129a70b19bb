#pragma once
#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace safesar {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Keying material for the tokenizer. Deliberately has no stream operator;
// the bytes are wiped when the object goes away.
class SecretKey {
public:
  explicit SecretKey(std::string bytes) : bytes_(std::move(bytes)) {}
  SecretKey(const SecretKey&) = default;
  SecretKey& operator=(const SecretKey&) = default;
  SecretKey(SecretKey&&) = default;
  SecretKey& operator=(SecretKey&&) = default;
  ~SecretKey();

  std::string_view bytes() const { return bytes_; }
  bool empty() const { return bytes_.empty(); }

private:
  std::string bytes_;
};

using AllowedFieldSet = std::set<std::string>;

constexpr std::size_t kDefaultDigestLength = 6;
constexpr std::size_t kMaxDigestLength = 64; // hex chars in a SHA-256 MAC

struct RedactionConfig {
  SecretKey       secretKey;
  AllowedFieldSet allowedFields;
  std::size_t     digestLength = kDefaultDigestLength;

  // Throws ConfigError when the key or the field list is missing/empty, or
  // the digest length is out of range.
  void validate() const;

  // Reads SAFESAR_REDACTION_SECRET, SAFESAR_ALLOWED_FIELDS and
  // SAFESAR_DIGEST_LENGTH. Throws ConfigError.
  static RedactionConfig fromEnv();
};

// "a, b,,c" -> {a, b, c}
AllowedFieldSet parseFieldList(std::string_view csv);

} // namespace safesar
