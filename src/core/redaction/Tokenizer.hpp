#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "PatternLibrary.hpp"
#include "core/config/RedactionConfig.hpp"

namespace safesar {

// Turns a matched substring into "[LABEL:digest]", where digest is the
// truncated HMAC-SHA256 of the substring. Pure; safe to share across threads.
class Tokenizer {
public:
  // Throws ConfigError on an empty key or an out-of-range digest length.
  Tokenizer(SecretKey key, std::size_t digestLength = kDefaultDigestLength);

  std::string digest(std::string_view matchedText) const;
  std::string tokenize(PatternKind kind, std::string_view matchedText) const;

private:
  SecretKey   key_;
  std::size_t digestLength_;
};

} // namespace safesar
