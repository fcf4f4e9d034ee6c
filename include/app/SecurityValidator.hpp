#pragma once

#include "app/Config.hpp"
#include "model/Finding.hpp"
#include "model/Summary.hpp"
#include "scan/ContentScanner.hpp"
#include "scan/InputSanitizer.hpp"
#include "scan/PathGuard.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vigil::app {

// Runs every layer over one generation run: the input text, the output
// directory path, the generated artifacts and their permissions.
class SecurityValidator {
public:
  explicit SecurityValidator(Config cfg);

  // Never throws. A stage that fails becomes a validation_error finding and
  // the remaining stages still run.
  [[nodiscard]] model::ValidationSummary validate_execution(std::string_view input,
                                                            const std::string& output_dir) const;

  [[nodiscard]] const Config& config() const { return cfg_; }
  [[nodiscard]] const scan::InputSanitizer& sanitizer() const { return sanitizer_; }
  [[nodiscard]] const scan::PathGuard& path_guard() const { return guard_; }
  [[nodiscard]] const scan::ContentScanner& scanner() const { return scanner_; }

private:
  Config cfg_;
  scan::InputSanitizer sanitizer_;
  scan::PathGuard guard_;
  scan::ContentScanner scanner_;
};

// Counts, per-category tallies and the overall status. Worst severity wins.
[[nodiscard]] auto summarize_findings(std::vector<model::Finding> findings) -> model::ValidationSummary;

// "[SEVERITY] category path[:line] [evidence]"
[[nodiscard]] auto format_finding_line(const model::Finding& f) -> std::string;

} // namespace vigil::app
