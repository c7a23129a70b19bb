#include "StringScrubber.hpp"

#include <re2/re2.h>
#include <algorithm>

namespace safesar {

std::size_t ScrubStats::total() const {
  std::size_t n = 0;
  for (auto h : hits) n += h;
  return n;
}

ScrubStats& ScrubStats::operator+=(const ScrubStats& other) {
  for (size_t i = 0; i < hits.size(); ++i) hits[i] += other.hits[i];
  return *this;
}

std::string ScrubStats::summary() const {
  std::string out;
  for (size_t i = 0; i < hits.size(); ++i) {
    if (hits[i] == 0) continue;
    if (!out.empty()) out += ',';
    out += patternLabel(static_cast<PatternKind>(i));
    out += ':';
    out += std::to_string(hits[i]);
  }
  return out.empty() ? "none" : out;
}

std::string StringScrubber::scrub(std::string_view s, ScrubStats* stats) const {
  std::string current(s);
  for (const auto& pattern : patterns_.patterns()) {
    std::size_t hits = 0;
    current = applyPattern(current, pattern, hits);
    if (stats) stats->hits[static_cast<size_t>(pattern.kind)] += hits;
  }
  return current;
}

std::string StringScrubber::applyPattern(const std::string& input,
                                         const SensitivePattern& pattern,
                                         std::size_t& hits) const {
  // A match wholly inside an earlier token (e.g. an all-digit digest seen by
  // the ACCOUNT detector) stays as it is. A match that only partly overlaps
  // tokens is widened to swallow them whole.
  const auto tokens = patterns_.tokenSpans(input);
  auto insideToken = [&](size_t begin, size_t end) {
    for (const auto& t : tokens) {
      if (begin >= t.first && end <= t.second) return true;
      if (t.first >= end) break;
    }
    return false;
  };
  auto widen = [&](size_t& begin, size_t& end) {
    for (const auto& t : tokens) {
      if (t.first >= end) break;
      if (t.second > begin) {
        begin = std::min(begin, t.first);
        end = std::max(end, t.second);
      }
    }
  };

  std::string out;
  out.reserve(input.size());
  re2::StringPiece text(input);
  re2::StringPiece m;
  size_t pos = 0;
  while (pos < input.size() &&
         pattern.matcher->Match(text, pos, input.size(), re2::RE2::UNANCHORED, &m, 1)) {
    size_t begin = static_cast<size_t>(m.data() - input.data());
    size_t end = begin + m.size();
    if (m.empty()) {
      // None of the built-in detectors can match empty, but never spin.
      out.append(input, pos, begin - pos);
      if (begin < input.size()) out += input[begin];
      pos = begin + 1;
      continue;
    }
    if (insideToken(begin, end)) {
      out.append(input, pos, end - pos);
    } else {
      widen(begin, end);
      begin = std::max(begin, pos);
      out.append(input, pos, begin - pos);
      out += tokenizer_.tokenize(pattern.kind, std::string_view(input).substr(begin, end - begin));
      ++hits;
    }
    pos = end;
  }
  if (pos < input.size()) out.append(input, pos, std::string::npos);
  return out;
}

} // namespace safesar
