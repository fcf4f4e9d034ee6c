#include "util/TextCodec.hpp"

#include <cstdint>
#include <cstdio>

namespace vigil::util {

// Decode one code point at s[i]. Returns the sequence length, or 0 if the
// bytes at i do not start a well-formed sequence.
static int decode_utf8(std::string_view s, std::size_t i, uint32_t& cp) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) { cp = b0; return 1; }

  int len = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) { len = 2; cp = b0 & 0x1F; }
  else if (b0 == 0xE0)          { len = 3; cp = b0 & 0x0F; lo = 0xA0; }
  else if (b0 == 0xED)          { len = 3; cp = b0 & 0x0F; hi = 0x9F; }
  else if (b0 >= 0xE1 && b0 <= 0xEF) { len = 3; cp = b0 & 0x0F; }
  else if (b0 == 0xF0)          { len = 4; cp = b0 & 0x07; lo = 0x90; }
  else if (b0 >= 0xF1 && b0 <= 0xF3) { len = 4; cp = b0 & 0x07; }
  else if (b0 == 0xF4)          { len = 4; cp = b0 & 0x07; hi = 0x8F; }
  else return 0;

  if (i + static_cast<std::size_t>(len) > s.size()) return 0;
  for (int k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    // Only the first continuation byte has a narrowed range.
    const unsigned char min = (k == 1) ? lo : 0x80;
    const unsigned char max = (k == 1) ? hi : 0xBF;
    if (b < min || b > max) return 0;
    cp = (cp << 6) | (b & 0x3F);
  }
  return len;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_valid_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    int len = decode_utf8(s, i, cp);
    if (len == 0) return false;
    i += static_cast<std::size_t>(len);
  }
  return true;
}

std::string repair_utf8(std::string_view s) {
  static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(s.size());
  std::size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    int len = decode_utf8(s, i, cp);
    if (len == 0) {
      out.append(kReplacement);
      ++i;
      continue;
    }
    out.append(s.substr(i, static_cast<std::size_t>(len)));
    i += static_cast<std::size_t>(len);
  }
  return out;
}

std::string unicode_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  char buf[16];
  std::size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    int len = decode_utf8(s, i, cp);
    if (len == 0) {
      std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(s[i]));
      out.append(buf);
      ++i;
      continue;
    }
    i += static_cast<std::size_t>(len);

    if (cp == '\\') { out.append("\\\\"); continue; }
    if (cp == '\t') { out.append("\\t"); continue; }
    if (cp == '\n') { out.append("\\n"); continue; }
    if (cp == '\r') { out.append("\\r"); continue; }
    if (cp >= 0x20 && cp < 0x7F) { out.push_back(static_cast<char>(cp)); continue; }

    if (cp < 0x100)        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(cp));
    else if (cp < 0x10000) std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(cp));
    else                   std::snprintf(buf, sizeof(buf), "\\U%08x", static_cast<unsigned>(cp));
    out.append(buf);
  }
  return out;
}

std::string percent_decode(std::string_view s) {
  if (s.find('%') == std::string_view::npos) return std::string(s);
  std::string out;
  out.reserve(s.size());
  std::string run; // consecutive decoded bytes
  std::size_t i = 0;
  while (i < s.size()) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]);
      int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        run.push_back(static_cast<char>((hi << 4) | lo));
        i += 3;
        continue;
      }
    }
    if (!run.empty()) {
      out.append(repair_utf8(run));
      run.clear();
    }
    out.push_back(s[i]);
    ++i;
  }
  if (!run.empty()) out.append(repair_utf8(run));
  return out;
}

std::string percent_decode_bounded(std::string_view s, int max_passes) {
  std::string text(s);
  for (int pass = 0; pass < max_passes; ++pass) {
    std::string decoded = percent_decode(text);
    if (decoded == text) break;
    text = std::move(decoded);
  }
  return text;
}

std::string html_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + s.size() / 8);
  for (char c : s) {
    switch (c) {
      case '&':  out.append("&amp;"); break;
      case '<':  out.append("&lt;"); break;
      case '>':  out.append("&gt;"); break;
      case '"':  out.append("&quot;"); break;
      case '\'': out.append("&#x27;"); break;
      default:   out.push_back(c); break;
    }
  }
  return out;
}

std::string strip_nul(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s)
    if (c != '\0') out.push_back(c);
  return out;
}

std::size_t utf8_floor(std::string_view s, std::size_t n) {
  if (n >= s.size()) return s.size();
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
  return n;
}

} // namespace vigil::util
