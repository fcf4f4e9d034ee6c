#include "app/SecurityValidator.hpp"
#include "util/Files.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

namespace vigil::app {

namespace fs = std::filesystem;

using model::Finding;
using model::Severity;
using model::Status;
using model::ValidationSummary;

static scan::ScanOptions scan_options(const Config& cfg) {
  scan::ScanOptions o;
  o.markup = cfg.scan.markup;
  o.max_files = cfg.scan.max_files;
  o.max_file_bytes = cfg.scan.max_file_bytes;
  return o;
}

static void append(std::vector<Finding>& out, std::vector<Finding>&& more) {
  out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

// Run one stage; an escaping exception is logged and recorded as a finding.
template <typename Stage>
static void run_stage(const char* name, const std::string& subject, bool verbose,
                      std::vector<Finding>& out, Stage&& stage) {
  const std::size_t before = out.size();
  try {
    stage(out);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vigil: SecurityValidator: %s stage failed: %s\n", name, e.what());
    Finding f;
    f.severity = Severity::Medium;
    f.category = "validation_error";
    f.description = std::string("Security validation error: ") + e.what();
    f.file_path = subject;
    f.recommendation = "Review validation process";
    out.push_back(std::move(f));
  }
  if (verbose) {
    std::fprintf(stderr, "vigil: SecurityValidator: %s: %zu finding(s)\n", name, out.size() - before);
  }
}

SecurityValidator::SecurityValidator(Config cfg)
    : cfg_(std::move(cfg)),
      sanitizer_(cfg_.input.max_input_bytes),
      guard_(cfg_.workspace_root),
      scanner_(scan_options(cfg_)) {}

ValidationSummary SecurityValidator::validate_execution(std::string_view input, const std::string& output_dir) const {
  std::vector<Finding> findings;
  const bool verbose = cfg_.log.verbose;
  if (verbose) {
    std::fprintf(stderr, "vigil: SecurityValidator: validating %zu input bytes, output %s\n",
                 input.size(), output_dir.c_str());
  }

  run_stage("input", "<input>", verbose, findings, [&](std::vector<Finding>& out){
    append(out, sanitizer_.analyze(input));
    if (cfg_.input.extended_checks) append(out, sanitizer_.inspect(input));
  });

  run_stage("path", output_dir, verbose, findings, [&](std::vector<Finding>& out){
    append(out, guard_.validate(output_dir).findings);
  });

  std::error_code ec;
  const bool have_dir = fs::is_directory(output_dir, ec) && !ec;
  if (!have_dir) {
    if (verbose) std::fprintf(stderr, "vigil: SecurityValidator: %s is not a directory, skipping scans\n", output_dir.c_str());
    return summarize_findings(std::move(findings));
  }

  run_stage("content", output_dir, verbose, findings, [&](std::vector<Finding>& out){
    append(out, scanner_.scan_tree(output_dir));
    if (!cfg_.scan.artifact_names) return;
    util::walk_tree(output_dir, [&](const fs::directory_entry& entry){
      std::error_code fec;
      if (entry.is_regular_file(fec) && !fec)
        append(out, guard_.check_artifact_name(entry.path().string(), cfg_.scan.allowed_extensions));
      return true;
    });
  });

  run_stage("permissions", output_dir, verbose, findings, [&](std::vector<Finding>& out){
    append(out, scanner_.check_permissions(output_dir));
  });

  return summarize_findings(std::move(findings));
}

auto summarize_findings(std::vector<Finding> findings) -> ValidationSummary {
  ValidationSummary s;
  s.total_findings = findings.size();
  for (const auto& f : findings) {
    switch (f.severity) {
      case Severity::Critical: ++s.critical; break;
      case Severity::High:     ++s.high; break;
      case Severity::Medium:   ++s.medium; break;
      case Severity::Low:      ++s.low; break;
    }
    bool seen = false;
    for (auto& [name, count] : s.categories) {
      if (name == f.category) { ++count; seen = true; break; }
    }
    if (!seen) s.categories.emplace_back(f.category, 1);
  }
  s.findings = std::move(findings);

  if (s.critical > 0) {
    s.status = Status::Critical;
    s.message = "Critical security issues found: " + std::to_string(s.critical);
  } else if (s.high > 0) {
    s.status = Status::HighRisk;
    s.message = "High-risk security issues found: " + std::to_string(s.high);
  } else if (s.medium > 0) {
    s.status = Status::MediumRisk;
    s.message = "Medium-risk security issues found: " + std::to_string(s.medium);
  } else if (s.low > 0) {
    s.status = Status::LowRisk;
    s.message = "Low-risk security issues found: " + std::to_string(s.low);
  } else {
    s.status = Status::Secure;
    s.message = "No security issues found";
  }
  return s;
}

auto format_finding_line(const Finding& f) -> std::string {
  std::string out = "[";
  out += model::severity_name(f.severity);
  out += "] ";
  out += f.category;
  out += ' ';
  out += f.file_path;
  if (f.line_number) out += ":" + std::to_string(*f.line_number);
  if (f.evidence && !f.evidence->empty()) {
    out += ' ';
    out += *f.evidence;
  }
  return out;
}

} // namespace vigil::app
