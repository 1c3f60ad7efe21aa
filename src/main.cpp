#include "app/Probe.hpp"
#include "ui/Config.hpp"
#include "ui/Formatter.hpp"
#include "ui/Json.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

#ifndef LANPROBE_VERSION
#define LANPROBE_VERSION "0.1.0"
#endif

static void print_usage(std::ostream& os) {
  os << "Usage: lanprobe [--config PATH] [--debug] [--version] [-h|--help]\n"
        "Prints one Waybar JSON object describing local interfaces and the devices on them.\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  bool debug = false;
  std::string bad_arg;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--debug") debug = true;
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else if (a == "--version") { std::cout << "lanprobe " << LANPROBE_VERSION << "\n"; return 0; }
    else { bad_arg = a; break; }
  }

  // stdout carries exactly one JSON object; the exit code is always 0
  try {
    auto cfg = lanprobe::ui::load_config(config_path);
    if (debug) cfg.general.debug = true;
    if (cfg.general.debug && !cfg.source_path.empty())
      std::fprintf(stderr, "lanprobe: Config: loaded %s\n", cfg.source_path.c_str());

    lanprobe::ui::RenderResult result;
    if (!bad_arg.empty()) {
      std::cerr << "lanprobe: unknown option '" << bad_arg << "'\n";
      print_usage(std::cerr);
      result = lanprobe::ui::Formatter(cfg.display).render_error("arguments", "unknown option " + bad_arg);
    } else {
      lanprobe::app::Probe pipeline(cfg);
      result = pipeline.run();
    }
    std::cout << lanprobe::ui::to_json(result) << "\n";
  } catch (const std::exception& e) {
    std::fprintf(stderr, "lanprobe: render failed: %s\n", e.what());
    std::cout << lanprobe::ui::fallback_json() << "\n";
  }
  std::cout.flush();
  return 0;
}
