#include "ui/Terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cstdlib>
#include <string>

namespace timr::ui {

bool color_enabled_for(std::FILE* out) {
  const char* nc = std::getenv("NO_COLOR");
  if (nc && *nc) return false;
  return out && ::isatty(::fileno(out)) == 1;
}

bool progress_report_enabled_for(std::FILE* out, bool configured) {
  return configured && color_enabled_for(out);
}

int term_cols(int fd) {
  struct winsize ws{};
  if (fd >= 0 && ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    char* end = nullptr;
    long v = std::strtol(c, &end, 10);
    if (end && *end == '\0' && v > 0 && v < 10000) return static_cast<int>(v);
  }
  return 80;
}

std::string sgr_truecolor(int r, int g, int b) {
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

AnsiTerminal::AnsiTerminal(std::FILE* out, bool color, bool progress_report)
    : out_(out), color_(color), progress_report_(progress_report) {}

void AnsiTerminal::previous_line() { write("\x1B[F"); }

void AnsiTerminal::clear_line() { write("\r\x1B[2K"); }

void AnsiTerminal::set_cursor_visible(bool visible) {
  write(visible ? "\x1B[?25h" : "\x1B[?25l");
}

int AnsiTerminal::columns() const {
  return term_cols(out_ ? ::fileno(out_) : -1);
}

std::string AnsiTerminal::fg_rgb(int r, int g, int b) const {
  if (!color_) return {};
  return sgr_truecolor(r, g, b);
}

std::string AnsiTerminal::fg_reset() const {
  if (!color_) return {};
  return "\x1B[39m";
}

// OSC 9;4 (ConEmu / Windows Terminal style); ignored by terminals without support
void AnsiTerminal::report_progress(int percent) {
  if (!progress_report_) return;
  percent = std::clamp(percent, 0, 100);
  write("\x1B]9;4;1;" + std::to_string(percent) + "\x07");
}

void AnsiTerminal::clear_progress() {
  if (!progress_report_) return;
  write("\x1B]9;4;0;0\x07");
}

void AnsiTerminal::bell() { write("\x07"); }

void AnsiTerminal::write(std::string_view text) {
  if (text.empty()) return;
  if (std::fwrite(text.data(), 1, text.size(), out_) != text.size()) failed_ = true;
}

void AnsiTerminal::flush() {
  if (std::fflush(out_) != 0 || std::ferror(out_) != 0) failed_ = true;
  if (failed_) throw IoError("failed to write to terminal");
}

CursorGuard::CursorGuard(ITerminal& term) : term_(term) {
  term_.set_cursor_visible(false);
}

CursorGuard::~CursorGuard() {
  if (!active_) return;
  // Unwinding path (IoError): best effort, never throws
  term_.set_cursor_visible(true);
  try { term_.flush(); } catch (const IoError&) {}
}

void CursorGuard::restore() {
  if (!active_) return;
  term_.set_cursor_visible(true);
  active_ = false;
}

} // namespace timr::ui
