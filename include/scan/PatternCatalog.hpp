#pragma once

#include "model/Finding.hpp"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::scan {

// One category of a catalog. sources[i] is the text regexes[i] was built from.
struct PatternSet {
  std::string category;
  std::vector<std::string> sources;
  std::vector<std::regex> regexes;   // ECMAScript, case-insensitive
};

using Catalog = std::vector<PatternSet>;

// Applied to untrusted input text: sql_injection, command_injection,
// template_injection, xss, path_traversal.
[[nodiscard]] const Catalog& threat_catalog();

// Applied to generated output: credentials, private_info, malicious_code.
[[nodiscard]] const Catalog& sensitive_catalog();

// Applied to markup-typed artifacts: dangerous_markup.
[[nodiscard]] const Catalog& markup_catalog();

// libstdc++'s regex executor recurses once per consumed character, so no
// search may see more than kRegexWindow + kRegexOverlap bytes. A match that
// starts in one window may run kRegexOverlap bytes into the next; longer
// matches are cut at that point.
inline constexpr std::size_t kRegexWindow = 4096;
inline constexpr std::size_t kRegexOverlap = 1024;

// Calls fn(begin, end) with byte offsets for each non-overlapping match of re
// in text, left to right, searching window by window.
template <typename Fn>
void for_each_match(std::string_view text, const std::regex& re, Fn fn) {
  const char* base = text.data();
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nominal = std::min(text.size(), pos + kRegexWindow);
    const std::size_t limit = std::min(text.size(), nominal + kRegexOverlap);
    const auto flags = pos > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;
    std::size_t next = nominal;
    std::cregex_iterator it(base + pos, base + limit, re, flags);
    for (const std::cregex_iterator end{}; it != end; ++it) {
      const std::size_t b = pos + static_cast<std::size_t>(it->position(0));
      if (b >= nominal) break;
      const std::size_t e = b + static_cast<std::size_t>(it->length(0));
      fn(b, e);
      next = std::max(next, e);
    }
    pos = next;
  }
}

// Windowed counterpart of std::regex_replace with a literal replacement.
[[nodiscard]] std::string replace_matches(std::string_view text, const std::regex& re,
                                          std::string_view replacement);

// Unknown categories map to Low.
[[nodiscard]] model::Severity severity_for(std::string_view category);

[[nodiscard]] std::string remediation_for(std::string_view category);

} // namespace vigil::scan
