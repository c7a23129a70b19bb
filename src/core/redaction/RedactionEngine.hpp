#pragma once
#include <string>
#include <string_view>

#include "FieldAllowlist.hpp"
#include "PatternLibrary.hpp"
#include "Record.hpp"
#include "StringScrubber.hpp"
#include "StructuralWalker.hpp"
#include "Tokenizer.hpp"
#include "core/config/RedactionConfig.hpp"

namespace safesar {

// Allowlist -> walk -> serialize. Built once from a validated config and
// immutable afterwards; one instance serves concurrent callers. To change the
// key or the field set, build a new engine.
class RedactionEngine {
public:
  // Throws ConfigError if config is incomplete.
  explicit RedactionEngine(RedactionConfig config);
  RedactionEngine(const RedactionEngine&) = delete;
  RedactionEngine& operator=(const RedactionEngine&) = delete;

  // Safe payload for JSON text. Text that does not parse is treated as {}.
  std::string buildSafePayload(std::string_view rawText, ScrubStats* stats = nullptr) const;
  std::string buildSafePayload(const std::string& rawText, ScrubStats* stats = nullptr) const {
    return buildSafePayload(std::string_view(rawText), stats);
  }
  std::string buildSafePayload(const char* rawText, ScrubStats* stats = nullptr) const {
    return buildSafePayload(std::string_view(rawText ? rawText : ""), stats);
  }
  // Safe payload for an already-parsed record.
  std::string buildSafePayload(const Record& raw, ScrubStats* stats = nullptr) const;

  // Allowlisted and scrubbed record, before serialization.
  Record sanitize(const Record& raw, ScrubStats* stats = nullptr) const;

  std::string scrub(std::string_view s, ScrubStats* stats = nullptr) const {
    return scrubber_.scrub(s, stats);
  }

  const Tokenizer& tokenizer() const { return tokenizer_; }

  // Compact JSON, UTF-8 as-is, invalid UTF-8 replaced rather than thrown.
  static std::string serialize(const Record& record);
  // Parses JSON text; anything unparseable becomes an empty object.
  static Record parseOrEmpty(std::string_view rawText);

private:
  AllowedFieldSet allowedFields_;
  PatternLibrary  patterns_;
  Tokenizer       tokenizer_;
  StringScrubber  scrubber_;
};

} // namespace safesar
