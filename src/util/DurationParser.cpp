#include "util/DurationParser.hpp"
#include <charconv>
#include <chrono>
#include <cstdio>
#include <limits>

namespace timr::util {

uint64_t max_duration_seconds() {
  using namespace std::chrono;
  // Half the clock range: start + duration must not wrap even late in uptime
  auto max_s = duration_cast<seconds>(steady_clock::duration::max()).count() / 2;
  return static_cast<uint64_t>(max_s);
}

static uint64_t unit_scale(char c) {
  switch (c) {
    case 's': return 1;
    case 'm': return 60;
    case 'h': return 3600;
    default:  return 0;
  }
}

// Adds digits * scale to total; false on overflow
static bool accumulate(std::string_view digits, uint64_t scale, uint64_t& total) {
  uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) return false;
  if (scale != 0 && n > std::numeric_limits<uint64_t>::max() / scale) return false;
  uint64_t add = n * scale;
  if (add > max_duration_seconds() - total) return false;
  total += add;
  return true;
}

ParseResult parse_duration(std::string_view text) {
  ParseResult r{};
  if (text.empty()) { r.error = ParseError::Empty; return r; }

  uint64_t total = 0;
  size_t num_start = 0, num_len = 0;   // pending digit buffer
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c >= '0' && c <= '9') {
      if (num_len == 0) num_start = i;
      ++num_len;
      continue;
    }
    uint64_t scale = unit_scale(c);
    if (scale == 0) {
      r.error = ParseError::InvalidCharacter; r.unit = c;
      return r;
    }
    if (num_len == 0) {
      r.error = ParseError::NoNumberBeforeUnit; r.unit = c;
      return r;
    }
    if (!accumulate(text.substr(num_start, num_len), scale, total)) {
      r.error = ParseError::Overflow;
      return r;
    }
    num_len = 0;
  }

  // Bare trailing number: seconds
  if (num_len > 0 && !accumulate(text.substr(num_start, num_len), 1, total)) {
    r.error = ParseError::Overflow;
    return r;
  }
  r.value.seconds = total;
  return r;
}

std::string describe(const ParseResult& r) {
  switch (r.error) {
    case ParseError::None: return {};
    case ParseError::Empty: return "Duration must not be empty";
    case ParseError::NoNumberBeforeUnit:
      if (r.unit == 'h') return "No number found before hours";
      if (r.unit == 'm') return "No number found before minutes";
      return "No number found before seconds";
    case ParseError::InvalidCharacter: {
      // Non-printable and non-ASCII bytes are shown escaped
      auto c = static_cast<unsigned char>(r.unit);
      if (c < 0x20 || c >= 0x7F) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", c);
        return std::string("Invalid time! (unexpected '") + buf + "')";
      }
      return std::string("Invalid time! (unexpected '") + r.unit + "')";
    }
    case ParseError::Overflow: return "Duration is too large";
  }
  return "Invalid time!";
}

} // namespace timr::util
