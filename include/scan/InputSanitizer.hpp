#pragma once

#include "model/Finding.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::scan {

// Classifies and neutralizes short untrusted text (the idea or problem
// statement that drives document generation).
class InputSanitizer {
public:
  static constexpr std::size_t kMaxSanitizedLength = 10000;
  static constexpr std::string_view kTruncationMarker = "... [TRUNCATED]";
  static constexpr std::string_view kFilteredToken = "[FILTERED]";
  static constexpr int kDecodePasses = 3;
  static constexpr std::size_t kDefaultMaxInputBytes = 1000000;

  explicit InputSanitizer(std::size_t max_input_bytes = kDefaultMaxInputBytes);

  // Every threat-catalog match in text, one finding per match.
  [[nodiscard]] std::vector<model::Finding> analyze(std::string_view text) const;

  // Size, NUL, control-character and prompt-manipulation checks.
  [[nodiscard]] std::vector<model::Finding> inspect(std::string_view text) const;

  // escape -> percent-decode -> strip NUL -> HTML-escape -> filter -> truncate
  [[nodiscard]] std::string sanitize(std::string_view text) const;

  // Replace threat-catalog matches with kFilteredToken until nothing matches.
  [[nodiscard]] static std::string filter_threats(std::string text);

  [[nodiscard]] std::size_t max_input_bytes() const { return max_input_bytes_; }

private:
  std::size_t max_input_bytes_;
};

} // namespace vigil::scan
