#include "util/Files.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace vigil::util {

auto read_file_string(const std::string& path, std::string* err) -> std::optional<std::string> {
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = errno ? std::strerror(errno) : "cannot open file";
    return std::nullopt;
  }
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    // File disappeared or became unreadable between open and read
    if (err) *err = errno ? std::strerror(errno) : "read failed";
    return std::nullopt;
  }
  return s;
}

bool has_path_prefix(const std::string& path, const std::string& prefix) {
  if (path.rfind(prefix, 0) == 0) return true;
  if (!prefix.empty() && prefix.back() == '/') {
    std::string trimmed = prefix.substr(0, prefix.size() - 1);
    if (path == trimmed) return true;
  }
  return false;
}

bool walk_tree(const std::filesystem::path& root,
               const std::function<bool(const std::filesystem::directory_entry&)>& visit) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    std::fprintf(stderr, "vigil: walk: cannot open %s: %s\n", root.c_str(), ec.message().c_str());
    return false;
  }
  const fs::recursive_directory_iterator end{};
  while (it != end) {
    if (!visit(*it)) return true;
    it.increment(ec);
    if (ec) {
      std::fprintf(stderr, "vigil: walk: error below %s: %s\n", root.c_str(), ec.message().c_str());
      return false;
    }
  }
  return true;
}

} // namespace vigil::util
