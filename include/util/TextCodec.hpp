#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vigil::util {

// Strict UTF-8 check: rejects overlongs, surrogates and code points > U+10FFFF.
[[nodiscard]] bool is_valid_utf8(std::string_view s);

// Replace every invalid UTF-8 sequence with U+FFFD.
[[nodiscard]] std::string repair_utf8(std::string_view s);

// Escape to printable ASCII: "\\", "\t", "\n", "\r", "\xhh", "\uhhhh",
// "\Uhhhhhhhh". Undecodable bytes are emitted as "\xhh".
[[nodiscard]] std::string unicode_escape(std::string_view s);

// One pass of %XX decoding. Malformed escapes are kept literally; decoded
// byte runs that are not valid UTF-8 are repaired with U+FFFD.
[[nodiscard]] std::string percent_decode(std::string_view s);

// Repeated percent_decode, at most max_passes, stopping once a pass changes
// nothing.
[[nodiscard]] std::string percent_decode_bounded(std::string_view s, int max_passes = 3);

// & < > " ' -> &amp; &lt; &gt; &quot; &#x27;
[[nodiscard]] std::string html_escape(std::string_view s);

[[nodiscard]] std::string strip_nul(std::string_view s);

// Largest n' <= n that does not split a UTF-8 sequence in s.
[[nodiscard]] std::size_t utf8_floor(std::string_view s, std::size_t n);

} // namespace vigil::util
