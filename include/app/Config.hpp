#pragma once

#include "ui/Formatting.hpp"
#include "util/TomlReader.hpp"
#include <optional>
#include <string>

namespace timr::app {

struct Config {
  bool bell{true};
  bool progress_report{true};
  timr::ui::ClockStyle clock{timr::ui::ClockStyle::H12};
  timr::ui::BarStyle bar{};
  bool debug{false};
};

struct Profile {
  std::string name;
  std::string duration;
};

// $XDG_CONFIG_HOME/timr.toml, else $HOME/.config/timr.toml; empty if neither is set
[[nodiscard]] std::string config_file_path();

// Environment variable helpers (TIMR_X or timr_x)
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

// Resolve every setting TOML -> env -> compiled default.
// have_toml=false skips the file layer (no config file present).
[[nodiscard]] Config resolve_config(const timr::util::TomlReader& toml, bool have_toml);

// Look a profile up by name. On failure returns nullopt and sets err.
[[nodiscard]] std::optional<Profile> find_profile(const timr::util::TomlReader& toml,
                                                  const std::string& name, std::string& err);

} // namespace timr::app
