#include "app/Config.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

namespace timr::app {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TIMR_", 0) == 0) {
    alt = std::string("timr_") + n.substr(5);
  } else if (n.rfind("timr_", 0) == 0) {
    alt = std::string("TIMR_") + n.substr(5);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/timr.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/timr.toml";
  return {};
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const timr::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const timr::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// "#RRGGBB" -> Rgb; malformed values keep the default
static timr::ui::Rgb resolve_rgb(const timr::util::TomlReader& toml, bool have_toml,
                                 const char* key, const char* env_name, timr::ui::Rgb def) {
  std::string hex = resolve_string(toml, have_toml, "ui", key, env_name, "");
  int r, g, b;
  if (!hex.empty() && parse_hex_rgb(hex, r, g, b)) return timr::ui::Rgb{r, g, b};
  return def;
}

static timr::ui::ClockStyle parse_clock_style(std::string s, timr::ui::ClockStyle defv) {
  for (auto& c : s) c = static_cast<char>(std::tolower((unsigned char)c));
  if (s == "12h" || s == "12") return timr::ui::ClockStyle::H12;
  if (s == "24h" || s == "24") return timr::ui::ClockStyle::H24;
  if (s == "locale" || s == "auto") return timr::ui::ClockStyle::Locale;
  return defv;
}

Config resolve_config(const timr::util::TomlReader& toml, bool have_toml) {
  Config c{};
  c.bell            = resolve_bool(toml, have_toml, "ui", "bell",            "TIMR_BELL", true);
  c.progress_report = resolve_bool(toml, have_toml, "ui", "progress_report", "TIMR_PROGRESS_REPORT", true);
  c.clock = parse_clock_style(resolve_string(toml, have_toml, "ui", "clock", "TIMR_CLOCK", "12h"),
                              timr::ui::ClockStyle::H12);

  timr::ui::BarStyle defaults{};
  c.bar.start = resolve_rgb(toml, have_toml, "bar_start", "TIMR_BAR_START", defaults.start);
  c.bar.end   = resolve_rgb(toml, have_toml, "bar_end",   "TIMR_BAR_END",   defaults.end);
  c.bar.empty = resolve_rgb(toml, have_toml, "bar_empty", "TIMR_BAR_EMPTY", defaults.empty);

  c.debug = env_flag("TIMR_DEBUG", false);
  return c;
}

std::optional<Profile> find_profile(const timr::util::TomlReader& toml,
                                    const std::string& name, std::string& err) {
  const auto& profiles = toml.array("profiles");
  if (profiles.empty()) {
    err = "Config does not contain any profiles";
    return std::nullopt;
  }
  for (const auto& t : profiles) {
    if (t.get("name") != name) continue;
    Profile p{t.get("name"), t.get("duration")};
    if (p.duration.empty()) {
      err = "Profile " + name + " has no duration";
      return std::nullopt;
    }
    return p;
  }
  err = "No profile found matching " + name;
  return std::nullopt;
}

} // namespace timr::app
