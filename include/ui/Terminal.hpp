#pragma once

#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>

namespace timr::ui {

// Fatal output failure (write or flush)
struct IoError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Capability set the countdown writes through. Only the render loop
// writes to it while a countdown is running.
class ITerminal {
public:
  virtual ~ITerminal() = default;

  // Move cursor to the beginning of the previous line
  virtual void previous_line() = 0;
  virtual void clear_line() = 0;
  virtual void set_cursor_visible(bool visible) = 0;

  // Visible column count; 80 when unknown
  [[nodiscard]] virtual int columns() const = 0;

  // Foreground truecolor escape, or "" when color is off
  [[nodiscard]] virtual std::string fg_rgb(int r, int g, int b) const = 0;
  [[nodiscard]] virtual std::string fg_reset() const = 0;

  // Host-integrated progress indicator. Default: unsupported, no-op
  virtual void report_progress(int /*percent*/) {}
  virtual void clear_progress() {}

  virtual void bell() = 0;
  virtual void write(std::string_view text) = 0;

  // Throws IoError on failure
  virtual void flush() = 0;
};

// Terminal capability detection
[[nodiscard]] bool color_enabled_for(std::FILE* out);
// OSC progress reports only go to a terminal, never into a pipe or file
[[nodiscard]] bool progress_report_enabled_for(std::FILE* out, bool configured);
[[nodiscard]] int term_cols(int fd);

// SGR code generation
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// ANSI/VT implementation over a stdio stream
class AnsiTerminal : public ITerminal {
public:
  AnsiTerminal(std::FILE* out, bool color, bool progress_report);
  AnsiTerminal(const AnsiTerminal&) = delete;
  AnsiTerminal& operator=(const AnsiTerminal&) = delete;

  void previous_line() override;
  void clear_line() override;
  void set_cursor_visible(bool visible) override;
  [[nodiscard]] int columns() const override;
  [[nodiscard]] std::string fg_rgb(int r, int g, int b) const override;
  [[nodiscard]] std::string fg_reset() const override;
  void report_progress(int percent) override;
  void clear_progress() override;
  void bell() override;
  void write(std::string_view text) override;
  void flush() override;

private:
  std::FILE* out_;
  bool color_;
  bool progress_report_;
  bool failed_{false};
};

// RAII: hide the cursor for the lifetime of the guard
class CursorGuard {
  ITerminal& term_;
  bool active_{true};
public:
  explicit CursorGuard(ITerminal& term);
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;

  // Show the cursor now; the destructor then does nothing
  void restore();
};

} // namespace timr::ui
