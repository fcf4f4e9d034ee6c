#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::app {

// Resolved per key: TOML file -> VIGIL_* environment -> compiled default.
struct Config {
  std::string workspace_root;          // empty until resolved; defaults to cwd

  struct Input {
    bool extended_checks{false};
    std::size_t max_input_bytes{1000000};
  } input;

  struct Scan {
    bool markup{true};
    bool artifact_names{false};
    std::vector<std::string> allowed_extensions{".md", ".txt", ".json", ".pseudo", ".feature", ".yaml", ".yml"};
    std::size_t max_files{0};                  // 0 = unlimited
    std::uintmax_t max_file_bytes{10485760};
  } scan;

  struct Log {
    bool verbose{false};
  } log;
};

// getenv that also accepts the lowercase vigil_ prefix.
const char* getenv_compat(const char* name);

// $VIGIL_CONFIG, else $XDG_CONFIG_HOME/vigil/config.toml, else
// $HOME/.config/vigil/config.toml. Empty if none can be formed.
std::string config_file_path();

// A missing or unreadable file is not an error: env and defaults apply.
[[nodiscard]] Config load_config(const std::string& path);
[[nodiscard]] Config load_config();

} // namespace vigil::app
