#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "PatternLibrary.hpp"
#include "Tokenizer.hpp"

namespace safesar {

// Per-kind replacement counts. Carries numbers only, never matched text.
struct ScrubStats {
  std::array<std::size_t, kPatternKindCount> hits{};

  std::size_t total() const;
  std::size_t count(PatternKind kind) const { return hits[static_cast<std::size_t>(kind)]; }
  ScrubStats& operator+=(const ScrubStats& other);
  // "EMAIL:1,CARD:2"; kinds with zero hits are omitted. "none" when empty.
  std::string summary() const;
};

class StringScrubber {
public:
  StringScrubber(const PatternLibrary& patterns, const Tokenizer& tokenizer)
    : patterns_(patterns), tokenizer_(tokenizer) {}

  // Folds the pattern list over s: each pattern rewrites every match in the
  // output of the previous one. stats, if given, is incremented.
  std::string scrub(std::string_view s, ScrubStats* stats = nullptr) const;

private:
  std::string applyPattern(const std::string& input,
                           const SensitivePattern& pattern,
                           std::size_t& hits) const;

  const PatternLibrary& patterns_;
  const Tokenizer&      tokenizer_;
};

} // namespace safesar
