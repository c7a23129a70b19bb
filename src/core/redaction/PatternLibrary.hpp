#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace re2 { class RE2; }

namespace safesar {

// Application order is the declaration order.
enum class PatternKind { Email, Ssn, Card, Account, Ip, Url, Domain };

constexpr std::size_t kPatternKindCount = 7;

// Text used inside the token brackets, e.g. "ACCT" for Account.
std::string_view patternLabel(PatternKind kind);

struct SensitivePattern {
  PatternKind                 kind;
  int                         priority; // 0 runs first
  std::shared_ptr<const re2::RE2> matcher;
};

// Fixed, ordered set of detectors. Built once; read-only afterwards, so a
// single instance can be shared by any number of threads.
class PatternLibrary {
public:
  // Library whose token recognizer expects digests of digestLength hex chars.
  explicit PatternLibrary(std::size_t digestLength);

  const std::vector<SensitivePattern>& patterns() const { return patterns_; }

  // [begin, end) byte ranges of every emitted token ("[LABEL:hex]") in
  // text, in order.
  std::vector<std::pair<size_t, size_t>> tokenSpans(const std::string& text) const;

private:
  std::vector<SensitivePattern>   patterns_;
  std::shared_ptr<const re2::RE2> tokenMatcher_;
};

} // namespace safesar
