#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lanprobe::util {

// Decode one UTF-8 codepoint. Returns bytes consumed (0 on malformed,
// overlong, surrogate or truncated input).
int decode_utf8(const char* s, size_t len, uint32_t* cp);

[[nodiscard]] bool utf8_valid(std::string_view sv);

// Copy of `sv` with every malformed byte replaced by U+FFFD.
std::string sanitize_utf8(std::string_view sv);

} // namespace lanprobe::util
