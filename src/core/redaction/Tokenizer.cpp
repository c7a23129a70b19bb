#include "Tokenizer.hpp"
#include "core/crypto/Digest.hpp"

namespace safesar {

Tokenizer::Tokenizer(SecretKey key, std::size_t digestLength)
  : key_(std::move(key)), digestLength_(digestLength) {
  if (key_.empty()) throw ConfigError("tokenizer requires a non-empty secret key");
  if (digestLength_ == 0 || digestLength_ > kMaxDigestLength)
    throw ConfigError("digest length must be between 1 and " + std::to_string(kMaxDigestLength));
}

std::string Tokenizer::digest(std::string_view matchedText) const {
  return hmac_sha256_hex(key_.bytes(), matchedText).substr(0, digestLength_);
}

std::string Tokenizer::tokenize(PatternKind kind, std::string_view matchedText) const {
  std::string out = "[";
  out += patternLabel(kind);
  out += ':';
  out += digest(matchedText);
  out += ']';
  return out;
}

} // namespace safesar
