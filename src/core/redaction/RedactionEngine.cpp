#include "RedactionEngine.hpp"

namespace safesar {

static const RedactionConfig& validated(const RedactionConfig& config) {
  config.validate();
  return config;
}

RedactionEngine::RedactionEngine(RedactionConfig config)
  : allowedFields_(validated(config).allowedFields),
    patterns_(config.digestLength),
    tokenizer_(std::move(config.secretKey), config.digestLength),
    scrubber_(patterns_, tokenizer_) {}

Record RedactionEngine::parseOrEmpty(std::string_view rawText) {
  Record parsed = Record::parse(rawText.begin(), rawText.end(), nullptr,
                                /*allow_exceptions*/ false);
  if (parsed.is_discarded()) return Record::object();
  return parsed;
}

std::string RedactionEngine::serialize(const Record& record) {
  return record.dump(-1, ' ', /*ensure_ascii*/ false,
                     Record::error_handler_t::replace);
}

Record RedactionEngine::sanitize(const Record& raw, ScrubStats* stats) const {
  return walk(allowlist(raw, allowedFields_), scrubber_, stats);
}

std::string RedactionEngine::buildSafePayload(std::string_view rawText, ScrubStats* stats) const {
  return buildSafePayload(parseOrEmpty(rawText), stats);
}

std::string RedactionEngine::buildSafePayload(const Record& raw, ScrubStats* stats) const {
  return serialize(sanitize(raw, stats));
}

} // namespace safesar
