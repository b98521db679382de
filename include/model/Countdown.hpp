#pragma once
#include <cstdint>

namespace timr::model {

// Parsed total duration in whole seconds
struct ElapsedSpec {
  uint64_t seconds{0};
};

// Derived per redraw; never stored across ticks
struct ProgressSample {
  double fraction{0.0};        // elapsed / total, may overshoot 1 slightly
  uint64_t remaining_s{0};
  int bar_width{0};            // [0, 30]
  int progress_width{0};       // [0, bar_width]
  int percent{0};
};

struct RemainingParts {
  uint64_t hours{0};
  uint64_t minutes{0};
  uint64_t seconds{0};
};

enum class Outcome { Completed, CancelledEarly };

struct LoopReport {
  Outcome outcome{Outcome::Completed};
  uint64_t redraws{0};
};

} // namespace timr::model
