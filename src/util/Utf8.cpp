#include "util/Utf8.hpp"

namespace lanprobe::util {

static constexpr const char* kReplacement = "\xEF\xBF\xBD"; // U+FFFD

static bool is_cont(char c) { return (static_cast<uint8_t>(c) & 0xC0) == 0x80; }

int decode_utf8(const char* s, size_t len, uint32_t* cp) {
  if (len == 0) return 0;
  auto c = static_cast<uint8_t>(s[0]);
  if (c < 0x80) { *cp = c; return 1; }
  if ((c & 0xE0) == 0xC0 && len >= 2 && is_cont(s[1])) {
    *cp = (static_cast<uint32_t>(c & 0x1F) << 6) | (s[1] & 0x3F);
    return (*cp >= 0x80) ? 2 : 0;
  }
  if ((c & 0xF0) == 0xE0 && len >= 3 && is_cont(s[1]) && is_cont(s[2])) {
    *cp = (static_cast<uint32_t>(c & 0x0F) << 12) | (static_cast<uint32_t>(s[1] & 0x3F) << 6) | (s[2] & 0x3F);
    if (*cp >= 0xD800 && *cp <= 0xDFFF) return 0;
    return (*cp >= 0x800) ? 3 : 0;
  }
  if ((c & 0xF8) == 0xF0 && len >= 4 && is_cont(s[1]) && is_cont(s[2]) && is_cont(s[3])) {
    *cp = (static_cast<uint32_t>(c & 0x07) << 18) | (static_cast<uint32_t>(s[1] & 0x3F) << 12)
        | (static_cast<uint32_t>(s[2] & 0x3F) << 6) | (s[3] & 0x3F);
    return (*cp >= 0x10000 && *cp <= 0x10FFFF) ? 4 : 0;
  }
  return 0;
}

bool utf8_valid(std::string_view sv) {
  size_t i = 0;
  uint32_t cp = 0;
  while (i < sv.size()) {
    int n = decode_utf8(sv.data() + i, sv.size() - i, &cp);
    if (n == 0) return false;
    i += static_cast<size_t>(n);
  }
  return true;
}

std::string sanitize_utf8(std::string_view sv) {
  std::string out;
  out.reserve(sv.size());
  size_t i = 0;
  uint32_t cp = 0;
  while (i < sv.size()) {
    int n = decode_utf8(sv.data() + i, sv.size() - i, &cp);
    if (n == 0) {
      out += kReplacement;
      ++i;
      continue;
    }
    out.append(sv.data() + i, static_cast<size_t>(n));
    i += static_cast<size_t>(n);
  }
  return out;
}

} // namespace lanprobe::util
