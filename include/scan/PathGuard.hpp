#pragma once

#include "model/Finding.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace vigil::scan {

struct PathVerdict {
  bool safe{false};
  std::vector<model::Finding> findings;
  std::string resolved;   // canonical absolute path; empty if resolution failed
};

// Validates paths against a workspace boundary fixed at construction.
class PathGuard {
public:
  static constexpr std::size_t kMaxNameLength = 255;

  explicit PathGuard(const std::filesystem::path& workspace_root);

  [[nodiscard]] const std::string& workspace_root() const { return root_; }

  [[nodiscard]] PathVerdict validate(const std::string& path) const;

  // Name checks for a generated artifact: extension allow-list, length,
  // hostile characters, reserved device names.
  [[nodiscard]] std::vector<model::Finding> check_artifact_name(
      const std::string& path, const std::vector<std::string>& allowed_extensions) const;

  // Never fails and never returns an empty name.
  [[nodiscard]] static std::string sanitize_filename(const std::string& name);

  // Lexically normalized, no trailing separator except for "/".
  [[nodiscard]] static std::string normalize(const std::string& path);

private:
  [[nodiscard]] bool within_root(const std::string& canonical) const;

  std::string root_;
};

} // namespace vigil::scan
