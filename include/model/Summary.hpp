#pragma once

#include "model/Finding.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::model {

enum class Status { Secure, LowRisk, MediumRisk, HighRisk, Critical };

[[nodiscard]] constexpr const char* status_name(Status s) {
  switch (s) {
    case Status::Critical:   return "CRITICAL";
    case Status::HighRisk:   return "HIGH_RISK";
    case Status::MediumRisk: return "MEDIUM_RISK";
    case Status::LowRisk:    return "LOW_RISK";
    case Status::Secure:     return "SECURE";
  }
  return "SECURE";
}

struct ValidationSummary {
  std::size_t total_findings{0};
  std::size_t critical{0};
  std::size_t high{0};
  std::size_t medium{0};
  std::size_t low{0};
  // category -> count, in order of first occurrence
  std::vector<std::pair<std::string, std::size_t>> categories;
  std::vector<Finding> findings;
  Status status{Status::Secure};
  std::string message{"No security issues found"};

  [[nodiscard]] std::size_t category_count(std::string_view category) const {
    for (const auto& [name, count] : categories)
      if (name == category) return count;
    return 0;
  }

  [[nodiscard]] bool has_category(std::string_view category) const {
    return category_count(category) != 0;
  }
};

} // namespace vigil::model
