#pragma once

#include <array>
#include <string>
#include <string_view>

namespace vigil::util {

// Locale-independent ASCII case folding; bytes >= 0x80 pass through unchanged.
inline constexpr std::array<unsigned char, 256> kAsciiLowerTable = []{
  std::array<unsigned char, 256> t{};
  for (int i = 0; i < 256; ++i) {
    t[i] = static_cast<unsigned char>((i >= 'A' && i <= 'Z') ? i + ('a' - 'A') : i);
  }
  return t;
}();

[[nodiscard]] constexpr char ascii_lower(unsigned char c) {
  return static_cast<char>(kAsciiLowerTable[c]);
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = ascii_lower(static_cast<unsigned char>(c));
  return out;
}

} // namespace vigil::util
