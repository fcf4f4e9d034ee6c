#include "scan/InputSanitizer.hpp"
#include "scan/PatternCatalog.hpp"
#include "util/AsciiLower.hpp"
#include "util/TextCodec.hpp"

#include <utility>

namespace vigil::scan {

using model::Finding;
using model::Severity;

static constexpr const char* kInputPath = "<input>";

// Phrases that try to steer the document generator rather than describe an idea.
static constexpr std::string_view kPromptPhrases[] = {
  "ignore previous instructions",
  "forget everything",
  "new instructions",
  "system prompt",
  "jailbreak",
  "pretend to be",
  "act as if",
};

static bool is_flagged_control(unsigned char c) {
  return c <= 0x08 || c == 0x0B || c == 0x0C || (c >= 0x0E && c <= 0x1F) || c == 0x7F;
}

static Finding input_finding(Severity severity, const std::string& category, std::string description) {
  Finding f;
  f.severity = severity;
  f.category = category;
  f.description = std::move(description);
  f.file_path = kInputPath;
  return f;
}

InputSanitizer::InputSanitizer(std::size_t max_input_bytes) : max_input_bytes_(max_input_bytes) {}

std::vector<Finding> InputSanitizer::analyze(std::string_view text) const {
  std::vector<Finding> findings;
  if (text.empty()) return findings;

  for (const auto& set : threat_catalog()) {
    const Severity severity = severity_for(set.category);
    const std::string recommendation = remediation_for(set.category);
    for (const auto& re : set.regexes) {
      for_each_match(text, re, [&](std::size_t b, std::size_t e){
        Finding f = input_finding(severity, set.category, "Potential " + set.category + " pattern detected");
        f.evidence = model::capped_evidence(text.substr(b, e - b));
        f.recommendation = recommendation;
        findings.push_back(std::move(f));
      });
    }
  }
  return findings;
}

std::vector<Finding> InputSanitizer::inspect(std::string_view text) const {
  std::vector<Finding> findings;
  if (text.empty()) return findings;

  if (text.size() > max_input_bytes_) {
    Finding f = input_finding(Severity::Medium, "input_size_limit", "Input size exceeds limit");
    f.evidence = std::to_string(text.size()) + " > " + std::to_string(max_input_bytes_) + " bytes";
    f.recommendation = "Shorten the input before submitting it";
    findings.push_back(std::move(f));
  }

  if (text.find('\0') != std::string_view::npos) {
    Finding f = input_finding(Severity::High, "null_bytes", "Null bytes detected");
    f.recommendation = "Reject input containing NUL bytes";
    findings.push_back(std::move(f));
  }

  std::size_t controls = 0;
  for (char c : text)
    if (is_flagged_control(static_cast<unsigned char>(c))) ++controls;
  if (controls * 10 > text.size()) {
    Finding f = input_finding(Severity::Medium, "control_characters", "Excessive control characters");
    f.evidence = std::to_string(controls) + " of " + std::to_string(text.size()) + " bytes";
    f.recommendation = "Strip control characters other than common whitespace";
    findings.push_back(std::move(f));
  }

  const std::string lower = util::to_lower_copy(text);
  for (auto phrase : kPromptPhrases) {
    if (lower.find(phrase) == std::string::npos) continue;
    Finding f = input_finding(severity_for("prompt_injection"), "prompt_injection",
                              "Prompt manipulation phrase detected");
    f.evidence = model::capped_evidence(phrase);
    f.recommendation = remediation_for("prompt_injection");
    findings.push_back(std::move(f));
    break;
  }
  return findings;
}

std::string InputSanitizer::filter_threats(std::string text) {
  // Passes after the first only match around tokens left by earlier
  // substitutions; each consumes input characters, so the loop terminates.
  for (;;) {
    std::string before = text;
    for (const auto& set : threat_catalog()) {
      for (const auto& re : set.regexes) {
        text = replace_matches(text, re, kFilteredToken);
      }
    }
    if (text == before) return text;
  }
}

std::string InputSanitizer::sanitize(std::string_view text) const {
  if (text.empty()) return {};

  std::string out = util::unicode_escape(text);
  out = util::percent_decode_bounded(out, kDecodePasses);
  out = util::strip_nul(out);
  out = util::html_escape(out);
  out = filter_threats(std::move(out));

  if (out.size() > kMaxSanitizedLength) {
    out.resize(util::utf8_floor(out, kMaxSanitizedLength));
    out.append(kTruncationMarker);
  }
  return out;
}

} // namespace vigil::scan
