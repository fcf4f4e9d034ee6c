// Filesystem helpers shared by the scanners
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace vigil::util {

// Read entire file as raw bytes. Returns std::nullopt on error and, if
// err is given, stores a human-readable reason there.
auto read_file_string(const std::string& path, std::string* err = nullptr) -> std::optional<std::string>;

// True if path starts with prefix. A prefix ending in '/' also matches the
// directory itself ("/etc" against "/etc/").
bool has_path_prefix(const std::string& path, const std::string& prefix);

// Visit every entry below root, depth-first, without following directory
// symlinks. The visitor returns false to stop early. Returns false if the
// walk could not start or was cut short by an iteration error (logged).
bool walk_tree(const std::filesystem::path& root,
               const std::function<bool(const std::filesystem::directory_entry&)>& visit);

} // namespace vigil::util
