#pragma once

#include "model/Finding.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::scan {

struct ScanOptions {
  bool markup{true};                              // dangerous_markup pass on .md/.html
  std::size_t max_files{0};                       // 0 = unlimited
  std::uintmax_t max_file_bytes{10u * 1024u * 1024u};
};

// Scans generated artifacts for leaked secrets, private data, malicious
// code and risky permissions. Only reads.
class ContentScanner {
public:
  explicit ContentScanner(ScanOptions opts = {});

  // Sensitive-catalog matches per line. Invalid UTF-8 yields nothing.
  [[nodiscard]] std::vector<model::Finding> scan_content(std::string_view content,
                                                         const std::string& file_path) const;

  // Never throws; I/O problems become scan_error findings.
  [[nodiscard]] std::vector<model::Finding> scan_file(const std::filesystem::path& path) const;

  [[nodiscard]] std::vector<model::Finding> scan_tree(const std::filesystem::path& root) const;

  [[nodiscard]] std::vector<model::Finding> check_permissions(const std::filesystem::path& root) const;

  [[nodiscard]] const ScanOptions& options() const { return opts_; }

private:
  [[nodiscard]] std::vector<model::Finding> scan_markup(std::string_view content,
                                                        const std::string& file_path) const;

  ScanOptions opts_;
};

// True for extensions that get the markup pass (.md .markdown .html .htm).
[[nodiscard]] bool is_markup_path(const std::filesystem::path& path);

} // namespace vigil::scan
