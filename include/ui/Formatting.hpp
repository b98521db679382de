#pragma once

#include "model/Countdown.hpp"
#include <cstdint>
#include <string>

namespace timr::ui {

class ITerminal;

struct Rgb { int r{0}; int g{0}; int b{0}; };

enum class ClockStyle { H12, H24, Locale };

// UTF-8 locale check for block glyphs
bool use_unicode();

// Date/time formatting
bool prefer_12h_clock_from_locale();
std::string format_time_now(ClockStyle style);

// Remaining time: "1h5m3s", "5m0s", "42s" (hours/minutes only when nonzero)
timr::model::RemainingParts split_remaining(uint64_t seconds);
std::string format_remaining(uint64_t seconds);

// Linear interpolation of one channel, rounded
int lerp_channel(int a, int b, double t);
Rgb lerp_rgb(const Rgb& a, const Rgb& b, double t);

// Bar geometry from terminal width
int bar_width_for(int columns);

// Filled cells, empty cells, color reset and "  NN%"
struct BarStyle {
  Rgb start{90, 105, 237};
  Rgb end{123, 90, 237};
  Rgb empty{100, 100, 100};
  std::string full_glyph{"█"};
  std::string empty_glyph{"▒"};
};
BarStyle ascii_bar_style(BarStyle base);
std::string compose_bar(const ITerminal& term, const timr::model::ProgressSample& s, const BarStyle& style);

} // namespace timr::ui
