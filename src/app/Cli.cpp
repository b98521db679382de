#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "util/DurationParser.hpp"
#include <cctype>
#include <filesystem>
#include <system_error>

#ifndef TIMR_VERSION
#define TIMR_VERSION "0.0.0"
#endif

namespace timr::app {

std::string version_text() {
  return std::string("timr v") + TIMR_VERSION;
}

std::string help_text() {
  std::string out = version_text() + "\n";
  out += "Usage: timr [options] <duration|profile>\n";
  out += "\n";
  out += "Options:\n";
  out += "  duration       Start a timer for duration (e.g. 90, 45s, 1h30m)\n";
  out += "  profile        Start a timer from a [[profiles]] entry in timr.toml\n";
  out += "  -v, --version  Print version information\n";
  out += "  -h, --help     Print this help message\n";
  return out;
}

CliArgs parse_args(int argc, const char* const* argv) {
  CliArgs out;
  if (argc < 2) return out;

  bool have_duration = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-v" || a == "--version") {
      out.action = CliAction::Version;
      out.exit_code = 0;
      return out;
    } else if (a == "-h" || a == "--help") {
      out.action = CliAction::Help;
      out.exit_code = 0;
      return out;
    } else if (!have_duration) {
      out.duration = a;
      have_duration = true;
    } else {
      out.action = CliAction::Fail;
      out.error = "Unknown option: " + a;
      out.show_hint = true;
      out.exit_code = 1;
      return out;
    }
  }
  out.action = CliAction::Run;
  out.exit_code = 0;
  return out;
}

ConfigFile load_config_file(const std::string& path) {
  ConfigFile cf;
  cf.path = path;
  if (path.empty()) return cf;

  std::error_code ec;
  auto st = std::filesystem::status(path, ec);
  if (!std::filesystem::exists(st)) {
    cf.state = ConfigState::Missing;
    return cf;
  }
  // A directory opens fine as a stream but reads nothing
  if (std::filesystem::is_directory(st) || !cf.toml.load(path)) {
    cf.state = ConfigState::Unreadable;
    return cf;
  }
  cf.state = ConfigState::Loaded;
  return cf;
}

DurationResolution resolve_duration(const std::string& arg, const ConfigFile& config) {
  DurationResolution res;
  if (arg.empty()) {
    res.error = "Duration must not be empty";
    return res;
  }

  if (std::isdigit(static_cast<unsigned char>(arg[0]))) {
    res.text = arg;
  } else {
    switch (config.state) {
      case ConfigState::NoPath:
        res.error = "cannot locate config file (HOME is not set)";
        return res;
      case ConfigState::Missing:
        res.error = config.path + " does not exist";
        return res;
      case ConfigState::Unreadable:
        res.error = "failed to read " + config.path;
        return res;
      case ConfigState::Loaded:
        break;
    }
    auto profile = find_profile(config.toml, arg, res.error);
    if (!profile) return res;
    res.text = profile->duration;
  }

  auto parsed = timr::util::parse_duration(res.text);
  if (!parsed.ok()) {
    res.error = timr::util::describe(parsed);
    return res;
  }
  res.ok = true;
  res.value = parsed.value;
  res.exit_code = 0;
  return res;
}

} // namespace timr::app
