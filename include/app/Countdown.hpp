#pragma once

#include "app/CancelMailbox.hpp"
#include "model/Countdown.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace timr::app {

// Time source for the render loop; swapped for a virtual clock in tests
class ITickClock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  virtual ~ITickClock() = default;
  [[nodiscard]] virtual time_point now() = 0;
  virtual void sleep_for(std::chrono::nanoseconds d) = 0;
};

class SteadyTickClock : public ITickClock {
public:
  [[nodiscard]] time_point now() override { return std::chrono::steady_clock::now(); }
  void sleep_for(std::chrono::nanoseconds d) override { std::this_thread::sleep_for(d); }
};

struct CountdownOptions {
  std::chrono::milliseconds interval{16};      // minimum time between redraws
  timr::ui::BarStyle bar{};
  bool bell{true};
  std::function<std::string()> clock_label;    // wall clock text; empty -> omitted
  bool debug{false};
};

// Pure progress math for one tick
[[nodiscard]] timr::model::ProgressSample sample_progress(std::chrono::nanoseconds elapsed,
                                                         std::chrono::nanoseconds total,
                                                         std::chrono::nanoseconds remaining,
                                                         int columns);

// Render loop: Running -> Completed | CancelledEarly
class Countdown {
public:
  Countdown(timr::ui::ITerminal& term, ITickClock& clock, const CancelMailbox& mailbox,
            CountdownOptions opts = {});

  // Runs until the deadline passes or the mailbox is signaled. Throws ui::IoError.
  timr::model::LoopReport run(timr::model::ElapsedSpec spec);

private:
  void redraw(ITickClock::time_point now, ITickClock::time_point start, ITickClock::time_point end);
  void finish_completed(timr::ui::CursorGuard& cursor);
  void finish_cancelled(timr::ui::CursorGuard& cursor);

  timr::ui::ITerminal& term_;
  ITickClock& clock_;
  const CancelMailbox& mailbox_;
  CountdownOptions opts_;
};

} // namespace timr::app
