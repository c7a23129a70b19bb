#include "RedactionConfig.hpp"
#include "Env.hpp"

#include <openssl/crypto.h>
#include <string>

namespace safesar {

SecretKey::~SecretKey() {
  if (!bytes_.empty()) OPENSSL_cleanse(&bytes_[0], bytes_.size());
}

static std::string trim(std::string_view s) {
  const char* ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return std::string(s.substr(b, e - b + 1));
}

AllowedFieldSet parseFieldList(std::string_view csv) {
  AllowedFieldSet out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(',', start);
    if (comma == std::string_view::npos) comma = csv.size();
    std::string name = trim(csv.substr(start, comma - start));
    if (!name.empty()) out.insert(std::move(name));
    start = comma + 1;
  }
  return out;
}

void RedactionConfig::validate() const {
  if (secretKey.empty())
    throw ConfigError("redaction secret is missing (SAFESAR_REDACTION_SECRET)");
  if (allowedFields.empty())
    throw ConfigError("allowed field list is missing (SAFESAR_ALLOWED_FIELDS)");
  if (digestLength == 0 || digestLength > kMaxDigestLength)
    throw ConfigError("digest length must be between 1 and " + std::to_string(kMaxDigestLength));
}

RedactionConfig RedactionConfig::fromEnv() {
  std::size_t digestLength = kDefaultDigestLength;
  const std::string lenStr = get_env_or("SAFESAR_DIGEST_LENGTH", "");
  if (!lenStr.empty()) {
    try {
      size_t used = 0;
      const unsigned long v = std::stoul(lenStr, &used);
      if (used != lenStr.size()) throw std::invalid_argument(lenStr);
      digestLength = static_cast<std::size_t>(v);
    } catch (const std::logic_error&) {
      throw ConfigError("SAFESAR_DIGEST_LENGTH is not a number: " + lenStr);
    }
  }

  RedactionConfig cfg{
    SecretKey(get_env_or("SAFESAR_REDACTION_SECRET", "")),
    parseFieldList(get_env_or("SAFESAR_ALLOWED_FIELDS", "")),
    digestLength
  };
  cfg.validate();
  return cfg;
}

} // namespace safesar
