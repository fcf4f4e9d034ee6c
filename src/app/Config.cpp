#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace vigil::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VIGIL_", 0) == 0) {
    alt = std::string("vigil_") + n.substr(6);
  } else if (n.rfind("vigil_", 0) == 0) {
    alt = std::string("VIGIL_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* explicit_path = getenv_compat("VIGIL_CONFIG"))
    return explicit_path;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vigil/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vigil/config.toml";
  return {};
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve an unsigned count from TOML -> env -> compiled default
static uint64_t resolve_uint(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, uint64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_uint(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name))
      return util::TomlReader::parse_uint(v, def);
  }
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  const std::string def_root = ec ? std::string(".") : cwd.string();

  // --- [workspace] ---
  c.workspace_root = resolve_string(toml, have_toml, "workspace", "root", "VIGIL_WORKSPACE_ROOT", def_root);

  // --- [input] ---
  c.input.extended_checks = resolve_bool(toml, have_toml, "input", "extended_checks", "VIGIL_EXTENDED_INPUT_CHECKS", false);
  c.input.max_input_bytes = resolve_uint(toml, have_toml, "input", "max_input_bytes", "VIGIL_MAX_INPUT_BYTES", c.input.max_input_bytes);

  // --- [scan] ---
  c.scan.markup         = resolve_bool(toml, have_toml, "scan", "markup",         "VIGIL_SCAN_MARKUP", true);
  c.scan.artifact_names = resolve_bool(toml, have_toml, "scan", "artifact_names", "VIGIL_SCAN_ARTIFACT_NAMES", false);
  c.scan.max_files      = resolve_uint(toml, have_toml, "scan", "max_files",      "VIGIL_MAX_FILES", 0);
  c.scan.max_file_bytes = resolve_uint(toml, have_toml, "scan", "max_file_bytes", "VIGIL_MAX_FILE_BYTES", c.scan.max_file_bytes);
  if (have_toml && toml.has("scan", "allowed_extensions"))
    c.scan.allowed_extensions = toml.get_string_list("scan", "allowed_extensions", c.scan.allowed_extensions);

  // --- [log] ---
  c.log.verbose = resolve_bool(toml, have_toml, "log", "verbose", "VIGIL_VERBOSE", false);

  if (c.log.verbose) {
    if (have_toml) std::fprintf(stderr, "vigil: Config: loaded %s\n", path.c_str());
    else std::fprintf(stderr, "vigil: Config: no config file, using environment and defaults\n");
  }
  return c;
}

Config load_config() {
  return load_config(config_file_path());
}

} // namespace vigil::app
