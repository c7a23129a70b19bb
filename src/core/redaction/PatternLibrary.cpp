#include "PatternLibrary.hpp"

#include <re2/re2.h>
#include <stdexcept>

namespace safesar {

namespace {

struct PatternDef {
  PatternKind kind;
  const char* label;
  const char* regex;
};

// CARD must precede ACCOUNT: both claim bare digit runs, and CARD takes the
// 13-19 digit ones first.
const std::array<PatternDef, kPatternKindCount> kPatternDefs = {{
  {PatternKind::Email,   "EMAIL",  R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"},
  {PatternKind::Ssn,     "SSN",    R"(\b\d{3}-\d{2}-\d{4}\b)"},
  {PatternKind::Card,    "CARD",   R"(\b(?:\d[ -]*?){13,19}\b)"},
  {PatternKind::Account, "ACCT",   R"(\b\d{6,18}\b)"},
  {PatternKind::Ip,      "IP",     R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d?\d)\b)"},
  {PatternKind::Url,     "URL",    R"((?i)\bhttps?://\S+\b)"},
  {PatternKind::Domain,  "DOMAIN", R"(\b(?:[A-Za-z0-9-]+\.)+[A-Za-z]{2,}\b)"},
}};

std::shared_ptr<const re2::RE2> compile(const std::string& pattern) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  std::shared_ptr<const re2::RE2> re = std::make_shared<re2::RE2>(pattern, options);
  if (!re->ok()) {
    throw std::logic_error("bad detector pattern: " + re->error());
  }
  return re;
}

} // namespace

std::string_view patternLabel(PatternKind kind) {
  return kPatternDefs[static_cast<size_t>(kind)].label;
}

PatternLibrary::PatternLibrary(std::size_t digestLength) {
  if (digestLength == 0) throw std::invalid_argument("digest length must be positive");

  std::string labels;
  int priority = 0;
  for (const auto& def : kPatternDefs) {
    patterns_.push_back(SensitivePattern{def.kind, priority++, compile(def.regex)});
    if (!labels.empty()) labels += '|';
    labels += def.label;
  }
  tokenMatcher_ = compile(R"(\[(?:)" + labels + R"():[0-9a-f]{)" +
                          std::to_string(digestLength) + R"(}\])");
}

std::vector<std::pair<size_t, size_t>> PatternLibrary::tokenSpans(const std::string& text) const {
  std::vector<std::pair<size_t, size_t>> spans;
  re2::StringPiece input(text);
  re2::StringPiece m;
  size_t pos = 0;
  while (pos < text.size() &&
         tokenMatcher_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &m, 1)) {
    const size_t begin = static_cast<size_t>(m.data() - text.data());
    const size_t end = begin + m.size();
    spans.emplace_back(begin, end);
    pos = end;
  }
  return spans;
}

} // namespace safesar
