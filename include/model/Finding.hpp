#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::model {

// Ordered by risk: Critical > High > Medium > Low.
enum class Severity : uint8_t { Low = 0, Medium = 1, High = 2, Critical = 3 };

inline constexpr std::size_t kEvidenceCap = 50;

struct Finding {
  Severity severity{Severity::Low};
  std::string category;                       // e.g. "sql_injection", "credentials"
  std::string description;
  std::string file_path;                      // "<input>" for analyzed text
  std::optional<int> line_number;             // 1-based
  std::optional<std::string> evidence;        // never longer than kEvidenceCap
  std::optional<std::string> recommendation;
};

[[nodiscard]] constexpr const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Critical: return "CRITICAL";
    case Severity::High:     return "HIGH";
    case Severity::Medium:   return "MEDIUM";
    case Severity::Low:      return "LOW";
  }
  return "LOW";
}

// Cut matched text to kEvidenceCap bytes without splitting a UTF-8 sequence.
[[nodiscard]] inline std::string capped_evidence(std::string_view matched) {
  if (matched.size() <= kEvidenceCap) return std::string(matched);
  std::size_t n = kEvidenceCap;
  while (n > 0 && (static_cast<unsigned char>(matched[n]) & 0xC0) == 0x80) --n;
  return std::string(matched.substr(0, n));
}

} // namespace vigil::model
