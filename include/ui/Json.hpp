#pragma once
#include <string>
#include <string_view>
#include "ui/Formatter.hpp"

namespace lanprobe::ui {

// {"text":...,"tooltip":...,"alt":...,"class":[...]} in that order, no trailing newline.
std::string to_json(const RenderResult& r);

// Minimal degraded object for when rendering itself failed.
const char* fallback_json() noexcept;

// RFC 8259 string body escaping; valid UTF-8 passes through, malformed bytes become U+FFFD.
void append_json_escaped(std::string& out, std::string_view sv);

} // namespace lanprobe::ui
