#pragma once

#include "model/Countdown.hpp"
#include "util/TomlReader.hpp"
#include <string>

namespace timr::app {

enum class CliAction { Run, Help, Version, Fail };

// Result of argv handling. Anything but Run ends the process with exit_code.
struct CliArgs {
  CliAction action{CliAction::Help};
  std::string duration;     // Run: the positional argument as given
  std::string error;        // Fail: message for stderr
  bool show_hint{false};    // Fail: also point at --help
  int exit_code{0};
};

[[nodiscard]] std::string version_text();
[[nodiscard]] std::string help_text();

[[nodiscard]] CliArgs parse_args(int argc, const char* const* argv);

enum class ConfigState { NoPath, Missing, Unreadable, Loaded };

// timr.toml, read once per run and shared by settings and profile lookup
struct ConfigFile {
  std::string path;
  ConfigState state{ConfigState::NoPath};
  timr::util::TomlReader toml;

  [[nodiscard]] bool loaded() const { return state == ConfigState::Loaded; }
};

[[nodiscard]] ConfigFile load_config_file(const std::string& path);

struct DurationResolution {
  bool ok{false};
  timr::model::ElapsedSpec value{};
  std::string text;         // literal argument or the profile's duration
  std::string error;
  int exit_code{1};
};

// Literal durations start with a digit; anything else names a profile.
// Parse errors in either form are reported through error.
[[nodiscard]] DurationResolution resolve_duration(const std::string& arg, const ConfigFile& config);

} // namespace timr::app
