#pragma once

#include "model/Countdown.hpp"
#include <string>
#include <string_view>

namespace timr::util {

enum class ParseError { None, Empty, NoNumberBeforeUnit, InvalidCharacter, Overflow };

struct ParseResult {
  timr::model::ElapsedSpec value{};
  ParseError error{ParseError::None};
  char unit{0};                // offending unit/character, when relevant

  [[nodiscard]] bool ok() const { return error == ParseError::None; }
};

// Largest total accepted; leaves headroom for adding to a steady_clock instant.
[[nodiscard]] uint64_t max_duration_seconds();

// Parse "1h30m", "90s", "45" ... into whole seconds.
// Digits followed by s/m/h accumulate left to right; trailing digits count as seconds.
[[nodiscard]] ParseResult parse_duration(std::string_view text);

// Human message for a failed parse (e.g. "No number found before minutes")
[[nodiscard]] std::string describe(const ParseResult& r);

} // namespace timr::util
