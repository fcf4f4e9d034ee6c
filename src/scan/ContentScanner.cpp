#include "scan/ContentScanner.hpp"
#include "scan/PatternCatalog.hpp"
#include "util/AsciiLower.hpp"
#include "util/Files.hpp"
#include "util/TextCodec.hpp"

#include <cstdio>
#include <iterator>
#include <system_error>
#include <utility>

#include <sys/stat.h>

namespace vigil::scan {

namespace fs = std::filesystem;

using model::Finding;
using model::Severity;

static constexpr std::string_view kPlaceholderWords[] = {"example", "placeholder", "dummy", "test"};
static constexpr std::string_view kDocExtensions[] = {".md", ".txt", ".json"};
static constexpr std::string_view kMarkupExtensions[] = {".md", ".markdown", ".html", ".htm"};

// Byte length of the line terminator at s[i], or 0. Covers \n, \r\n, \r,
// \v, \f, \x1c-\x1e and the UTF-8 forms of U+0085, U+2028 and U+2029.
static std::size_t terminator_length(std::string_view s, std::size_t i) {
  const auto u = static_cast<unsigned char>(s[i]);
  if (u == '\r') return (i + 1 < s.size() && s[i + 1] == '\n') ? 2 : 1;
  if (u == '\n' || u == '\v' || u == '\f' || (u >= 0x1C && u <= 0x1E)) return 1;
  if (u == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x85) return 2;
  if (u == 0xE2 && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x80) {
    const auto t = static_cast<unsigned char>(s[i + 2]);
    if (t == 0xA8 || t == 0xA9) return 3;
  }
  return 0;
}

// A trailing terminator does not open a new line.
static std::vector<std::string_view> split_lines(std::string_view s) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < s.size()) {
    const std::size_t len = terminator_length(s, i);
    if (len == 0) {
      ++i;
      continue;
    }
    lines.push_back(s.substr(start, i - start));
    i += len;
    start = i;
  }
  if (start < s.size()) lines.push_back(s.substr(start));
  return lines;
}

static bool looks_like_placeholder(std::string_view line) {
  const std::string lower = util::to_lower_copy(line);
  for (auto w : kPlaceholderWords)
    if (lower.find(w) != std::string::npos) return true;
  return false;
}

static Finding file_finding(Severity severity, const char* category, std::string description,
                            const std::string& path, const char* recommendation) {
  Finding f;
  f.severity = severity;
  f.category = category;
  f.description = std::move(description);
  f.file_path = path;
  f.recommendation = recommendation;
  return f;
}

// One finding per match per line. base(category) gives the severity before
// the placeholder downgrade.
template <typename SeverityFn, typename RecommendFn>
static void match_lines(std::string_view content, const std::string& path, const Catalog& catalog,
                        SeverityFn base, RecommendFn recommend, std::vector<Finding>& out) {
  const auto lines = split_lines(content);
  for (std::size_t n = 0; n < lines.size(); ++n) {
    const std::string_view line = lines[n];
    if (line.empty()) continue;
    int placeholder = -1;   // computed on first match
    for (const auto& set : catalog) {
      for (const auto& re : set.regexes) {
        for_each_match(line, re, [&](std::size_t b, std::size_t e){
          if (placeholder < 0) placeholder = looks_like_placeholder(line) ? 1 : 0;
          Finding f;
          f.severity = placeholder ? Severity::Low : base(set.category);
          f.category = set.category;
          f.description = "Potential " + set.category + " detected";
          f.file_path = path;
          f.line_number = static_cast<int>(n + 1);
          f.evidence = model::capped_evidence(line.substr(b, e - b));
          f.recommendation = recommend(set.category);
          out.push_back(std::move(f));
        });
      }
    }
  }
}

bool is_markup_path(const fs::path& path) {
  const std::string ext = util::to_lower_copy(path.extension().string());
  for (auto e : kMarkupExtensions)
    if (ext == e) return true;
  return false;
}

ContentScanner::ContentScanner(ScanOptions opts) : opts_(opts) {}

std::vector<Finding> ContentScanner::scan_content(std::string_view content, const std::string& file_path) const {
  std::vector<Finding> findings;
  if (!util::is_valid_utf8(content)) return findings;
  match_lines(content, file_path, sensitive_catalog(),
              [](const std::string& category){ return category == "credentials" ? Severity::High : Severity::Medium; },
              [](const std::string& category){ return "Remove or obfuscate " + category + " from source code"; },
              findings);
  return findings;
}

std::vector<Finding> ContentScanner::scan_markup(std::string_view content, const std::string& file_path) const {
  std::vector<Finding> findings;
  match_lines(content, file_path, markup_catalog(),
              [](const std::string& category){ return severity_for(category); },
              [](const std::string& category){ return remediation_for(category); },
              findings);
  return findings;
}

std::vector<Finding> ContentScanner::scan_file(const fs::path& path) const {
  std::vector<Finding> findings;
  const std::string shown = path.string();

  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (!ec && size > opts_.max_file_bytes) {
    Finding f = file_finding(Severity::Low, "file_size_limit", "File too large to scan", shown,
                             "Split or shrink oversized generated files");
    f.evidence = std::to_string(size) + " > " + std::to_string(opts_.max_file_bytes) + " bytes";
    findings.push_back(std::move(f));
    return findings;
  }

  std::string err;
  auto content = util::read_file_string(shown, &err);
  if (!content) {
    std::fprintf(stderr, "vigil: ContentScanner: cannot read %s: %s\n", shown.c_str(), err.c_str());
    findings.push_back(file_finding(Severity::Low, "scan_error", "Error scanning file: " + err, shown,
                                    "Investigate file scan errors"));
    return findings;
  }

  if (!util::is_valid_utf8(*content)) {
    findings.push_back(file_finding(Severity::Medium, "binary_file", "Binary file detected in documentation",
                                    shown, "Ensure binary files are safe and necessary"));
    return findings;
  }

  findings = scan_content(*content, shown);
  if (opts_.markup && is_markup_path(path)) {
    auto markup = scan_markup(*content, shown);
    findings.insert(findings.end(), std::make_move_iterator(markup.begin()), std::make_move_iterator(markup.end()));
  }
  return findings;
}

std::vector<Finding> ContentScanner::scan_tree(const fs::path& root) const {
  std::vector<Finding> findings;
  std::size_t files = 0;
  util::walk_tree(root, [&](const fs::directory_entry& entry){
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return true;
    if (opts_.max_files > 0 && files >= opts_.max_files) {
      Finding f = file_finding(Severity::Low, "scan_budget", "File scan budget exhausted", root.string(),
                               "Raise scan.max_files or split the output directory");
      f.evidence = std::to_string(opts_.max_files) + " files scanned";
      findings.push_back(std::move(f));
      return false;
    }
    ++files;
    auto file_findings = scan_file(entry.path());
    findings.insert(findings.end(), std::make_move_iterator(file_findings.begin()),
                    std::make_move_iterator(file_findings.end()));
    return true;
  });
  return findings;
}

std::vector<Finding> ContentScanner::check_permissions(const fs::path& root) const {
  std::vector<Finding> findings;
  util::walk_tree(root, [&](const fs::directory_entry& entry){
    const std::string shown = entry.path().string();
    struct stat st{};
    if (::lstat(shown.c_str(), &st) != 0) return true;

    if (S_ISDIR(st.st_mode)) {
      if (st.st_mode & S_IWOTH) {
        findings.push_back(file_finding(Severity::Medium, "directory_permissions", "World-writable directory",
                                        shown, "Remove world-write permissions from output directories"));
      }
      return true;
    }
    // Symlinks are judged by what they point at; dangling ones are skipped.
    if (S_ISLNK(st.st_mode) && ::stat(shown.c_str(), &st) != 0) return true;
    if (S_ISDIR(st.st_mode)) return true;

    if (st.st_mode & S_IWOTH) {
      findings.push_back(file_finding(Severity::Medium, "file_permissions", "World-writable file", shown,
                                      "Remove world-write permissions"));
    }
    const std::string ext = entry.path().extension().string();
    bool doc = false;
    for (auto e : kDocExtensions)
      if (ext == e) doc = true;
    if (doc && (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH))) {
      findings.push_back(file_finding(Severity::Low, "file_permissions", "Executable documentation file", shown,
                                      "Remove execute permissions from documentation files"));
    }
    return true;
  });
  return findings;
}

} // namespace vigil::scan
