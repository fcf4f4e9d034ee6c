#include "scan/PathGuard.hpp"
#include "util/AsciiLower.hpp"
#include "util/Files.hpp"
#include "util/TextCodec.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

namespace vigil::scan {

using model::Finding;
using model::Severity;

static constexpr int kDecodePasses = 3;

// Compared against the lowercased canonical path.
static constexpr const char* kDeniedPrefixes[] = {
  "/etc/", "/usr/", "/var/", "/root/", "/home/",
  "c:/windows/", "c:/users/", "c:/program files/",
};

static constexpr std::string_view kReservedNames[] = {
  "CON", "PRN", "AUX", "NUL",
  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
  "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

static bool is_hostile_name_char(char c) {
  switch (c) {
    case '/': case '\\': case '<': case '>': case ':':
    case '"': case '|': case '?': case '*': case '\0':
      return true;
    default:
      return false;
  }
}

// "C:/..." is absolute even where the host does not know drive letters.
static bool has_drive_prefix(const std::string& p) {
  return p.size() >= 3 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':' && p[2] == '/';
}

static Finding path_finding(Severity severity, const char* category, const char* description,
                            const std::string& original) {
  Finding f;
  f.severity = severity;
  f.category = category;
  f.description = description;
  f.file_path = original;
  return f;
}

PathGuard::PathGuard(const std::filesystem::path& workspace_root) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(workspace_root, ec);
  root_ = normalize(ec ? workspace_root.string() : abs.string());
}

std::string PathGuard::normalize(const std::string& path) {
  std::string out = std::filesystem::path(path).lexically_normal().string();
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

bool PathGuard::within_root(const std::string& canonical) const {
  if (root_ == "/") return !canonical.empty() && canonical.front() == '/';
  if (canonical.rfind(root_, 0) != 0) return false;
  return canonical.size() == root_.size() || canonical[root_.size()] == '/';
}

PathVerdict PathGuard::validate(const std::string& path) const {
  PathVerdict v;
  try {
    std::string p = util::percent_decode_bounded(path, kDecodePasses);
    std::replace(p.begin(), p.end(), '\\', '/');
    p = util::strip_nul(p);

    // Fires on the token alone; the boundary check below decides escapes.
    if (p.find("..") != std::string::npos) {
      Finding f = path_finding(Severity::High, "path_traversal", "Path traversal attempt detected", path);
      f.evidence = "..";
      f.recommendation = "Use absolute paths within workspace boundary";
      v.findings.push_back(std::move(f));
    }

    std::filesystem::path fp(p);
    if (!fp.is_absolute() && !has_drive_prefix(p)) fp = std::filesystem::path(root_) / fp;
    const std::string canonical = normalize(fp.string());
    v.resolved = canonical;

    if (!within_root(canonical)) {
      Finding f = path_finding(Severity::Critical, "path_traversal", "Path outside workspace boundary", path);
      f.evidence = model::capped_evidence(canonical);
      f.recommendation = "Ensure all paths remain within workspace";
      v.findings.push_back(std::move(f));
    }

    const std::string lower = util::to_lower_copy(canonical);
    for (const char* denied : kDeniedPrefixes) {
      if (!util::has_path_prefix(lower, denied)) continue;
      Finding f = path_finding(Severity::Critical, "system_access", "Attempt to access system directory", path);
      f.evidence = denied;
      f.recommendation = "Block access to system directories";
      v.findings.push_back(std::move(f));
    }

    v.safe = v.findings.empty();
  } catch (const std::exception& e) {
    Finding f = path_finding(Severity::Medium, "path_validation", "Path validation error", path);
    f.description += std::string(": ") + e.what();
    f.recommendation = "Handle path validation errors gracefully";
    v.findings.push_back(std::move(f));
    v.safe = false;
    v.resolved.clear();
  }
  return v;
}

std::vector<Finding> PathGuard::check_artifact_name(const std::string& path,
                                                    const std::vector<std::string>& allowed_extensions) const {
  std::vector<Finding> findings;
  auto sep = path.find_last_of("/\\");
  const std::string filename = (sep == std::string::npos) ? path : path.substr(sep + 1);

  const std::string ext = util::to_lower_copy(std::filesystem::path(filename).extension().string());
  if (!ext.empty() &&
      std::find(allowed_extensions.begin(), allowed_extensions.end(), ext) == allowed_extensions.end()) {
    Finding f = path_finding(Severity::Medium, "invalid_extension", "File extension not allowed", path);
    f.evidence = model::capped_evidence(ext);
    f.recommendation = "Generate only documentation file types";
    findings.push_back(std::move(f));
  }

  if (path.size() > kMaxNameLength) {
    Finding f = path_finding(Severity::Low, "path_length_limit", "Path too long", path);
    f.evidence = std::to_string(path.size()) + " bytes";
    f.recommendation = "Shorten generated file and directory names";
    findings.push_back(std::move(f));
  }

  auto bad = std::find_if(filename.begin(), filename.end(), [](char c){
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || is_hostile_name_char(c);
  });
  if (bad != filename.end()) {
    Finding f = path_finding(Severity::Medium, "invalid_filename", "Invalid characters in filename", path);
    f.evidence = model::capped_evidence(filename);
    f.recommendation = "Pass generated names through filename sanitizing";
    findings.push_back(std::move(f));
  }

  std::string stem = filename.substr(0, filename.find('.'));
  std::transform(stem.begin(), stem.end(), stem.begin(),
                 [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  if (std::find(std::begin(kReservedNames), std::end(kReservedNames), stem) != std::end(kReservedNames)) {
    Finding f = path_finding(Severity::Medium, "reserved_filename", "Reserved filename", path);
    f.evidence = stem;
    f.recommendation = "Avoid device names reserved on Windows";
    findings.push_back(std::move(f));
  }
  return findings;
}

std::string PathGuard::sanitize_filename(const std::string& name) {
  if (name.empty()) return "unnamed_file";

  std::string out = name;
  for (auto& c : out)
    if (is_hostile_name_char(c)) c = '_';

  // No hidden files
  auto first = out.find_first_not_of('.');
  out = (first == std::string::npos) ? std::string() : out.substr(first);

  if (out.size() > kMaxNameLength) {
    auto dot = out.rfind('.');
    std::string ext = (dot != std::string::npos && dot > 0) ? out.substr(dot) : std::string();
    if (ext.size() >= kMaxNameLength) ext.clear();
    std::string stem = out.substr(0, out.size() - ext.size());
    stem.resize(util::utf8_floor(stem, kMaxNameLength - ext.size()));
    out = stem + ext;
  }

  bool blank = std::all_of(out.begin(), out.end(), [](unsigned char c){ return std::isspace(c) != 0; });
  if (blank) return "safe_filename";
  return out;
}

} // namespace vigil::scan
