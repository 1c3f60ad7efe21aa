#include "ui/Json.hpp"
#include <cstdio>
#include "util/Utf8.hpp"

namespace lanprobe::ui {

void append_json_escaped(std::string& out, std::string_view raw) {
  // interface names and hostnames are arbitrary bytes; JSON text must be UTF-8
  std::string sv = lanprobe::util::sanitize_utf8(raw);
  for (char c : sv) {
    auto uc = static_cast<unsigned char>(c);
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (c == '\b') out += "\\b";
    else if (c == '\f') out += "\\f";
    else if (uc < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
      out += buf;
    } else out += c;
  }
}

static void append_field(std::string& out, const char* key, std::string_view value) {
  out += '"';  out += key;  out += "\":\"";
  append_json_escaped(out, value);
  out += '"';
}

std::string to_json(const RenderResult& r) {
  std::string out;
  out.reserve(64 + r.text.size() + r.tooltip.size() + r.alt.size());
  out += '{';
  append_field(out, "text", r.text);     out += ',';
  append_field(out, "tooltip", r.tooltip); out += ',';
  append_field(out, "alt", r.alt);       out += ',';
  out += "\"class\":[";
  for (size_t i = 0; i < r.classes.size(); ++i) {
    if (i) out += ',';
    out += '"';
    append_json_escaped(out, r.classes[i]);
    out += '"';
  }
  out += "]}";
  return out;
}

const char* fallback_json() noexcept {
  return "{\"text\":\"\xF0\x9F\x96\xA7 --\",\"tooltip\":\"Network unavailable\","
         "\"alt\":\"error\",\"class\":[\"network\",\"error\"]}";
}

} // namespace lanprobe::ui
