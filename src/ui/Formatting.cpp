#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cctype>
#include <clocale>
#include <cmath>
#include <cstdlib>
#include <ctime>
#ifdef __linux__
#include <langinfo.h>
#endif

namespace timr::ui {

bool use_unicode() {
#ifdef __linux__
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = static_cast<char>(std::tolower((unsigned char)c));
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
#else
  return false;
#endif
}

bool prefer_12h_clock_from_locale() {
#ifdef __linux__
  static bool inited = false;
  if (!inited) {
    std::setlocale(LC_TIME, "");
    inited = true;
  }
#ifdef T_FMT
  const char* tfmt = nl_langinfo(T_FMT);
  if (tfmt && *tfmt) {
    std::string f = tfmt;
    if (f.find("%I") != std::string::npos || f.find("%p") != std::string::npos) return true;
  }
#endif
#endif
  return false;
}

// "3:07pm" or "15:07"
std::string format_time_now(ClockStyle style) {
  bool h12 = style == ClockStyle::H12 ||
             (style == ClockStyle::Locale && prefer_12h_clock_from_locale());
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[32];
  const char* fmt = h12 ? "%I:%M%P" : "%H:%M";
  if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return std::string();
  if (h12 && buf[0] == '0') return std::string(buf + 1);
  return std::string(buf);
}

timr::model::RemainingParts split_remaining(uint64_t seconds) {
  timr::model::RemainingParts p;
  p.hours = seconds / 3600;
  p.minutes = (seconds % 3600) / 60;
  p.seconds = seconds % 60;
  return p;
}

std::string format_remaining(uint64_t seconds) {
  auto p = split_remaining(seconds);
  std::string out;
  if (p.hours > 0) out += std::to_string(p.hours) + "h";
  if (p.minutes > 0) out += std::to_string(p.minutes) + "m";
  out += std::to_string(p.seconds) + "s";
  return out;
}

int lerp_channel(int a, int b, double t) {
  return static_cast<int>(std::lround((1.0 - t) * a + t * b));
}

Rgb lerp_rgb(const Rgb& a, const Rgb& b, double t) {
  return Rgb{lerp_channel(a.r, b.r, t), lerp_channel(a.g, b.g, t), lerp_channel(a.b, b.b, t)};
}

int bar_width_for(int columns) {
  return std::clamp(columns - 15, 0, 30);
}

BarStyle ascii_bar_style(BarStyle base) {
  base.full_glyph = "#";
  base.empty_glyph = "-";
  return base;
}

std::string compose_bar(const ITerminal& term, const timr::model::ProgressSample& s, const BarStyle& style) {
  std::string out;
  for (int i = 0; i < s.progress_width; ++i) {
    double t = static_cast<double>(i) / static_cast<double>(s.bar_width);
    Rgb c = lerp_rgb(style.start, style.end, t);
    out += term.fg_rgb(c.r, c.g, c.b);
    out += style.full_glyph;
  }
  out += term.fg_rgb(style.empty.r, style.empty.g, style.empty.b);
  for (int i = s.progress_width; i < s.bar_width; ++i) out += style.empty_glyph;
  out += term.fg_reset();
  out += "  " + std::to_string(s.percent) + "%";
  return out;
}

} // namespace timr::ui
