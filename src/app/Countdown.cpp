#include "app/Countdown.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace timr::app {

using namespace std::chrono;

timr::model::ProgressSample sample_progress(nanoseconds elapsed, nanoseconds total,
                                            nanoseconds remaining, int columns) {
  timr::model::ProgressSample s;
  auto elapsed_ms = duration_cast<milliseconds>(elapsed).count();
  auto total_ms = duration_cast<milliseconds>(total).count();
  s.fraction = total_ms > 0 ? static_cast<double>(elapsed_ms) / static_cast<double>(total_ms) : 1.0;
  if (s.fraction < 0.0) s.fraction = 0.0;
  s.bar_width = timr::ui::bar_width_for(columns);
  s.progress_width = std::clamp(static_cast<int>(std::lround(s.fraction * s.bar_width)), 0, s.bar_width);
  s.percent = static_cast<int>(std::lround(s.fraction * 100.0));
  s.remaining_s = remaining.count() > 0 ? static_cast<uint64_t>(duration_cast<seconds>(remaining).count()) : 0;
  return s;
}

Countdown::Countdown(timr::ui::ITerminal& term, ITickClock& clock, const CancelMailbox& mailbox,
                     CountdownOptions opts)
    : term_(term), clock_(clock), mailbox_(mailbox), opts_(std::move(opts)) {}

timr::model::LoopReport Countdown::run(timr::model::ElapsedSpec spec) {
  timr::model::LoopReport report;
  const auto start = clock_.now();
  const auto end = start + seconds(spec.seconds);
  auto last_update = start;

  if (opts_.debug) {
    std::fprintf(stderr, "timr: countdown: %llus, redraw interval %lldms\n",
                 static_cast<unsigned long long>(spec.seconds),
                 static_cast<long long>(opts_.interval.count()));
  }

  timr::ui::CursorGuard cursor(term_);
  term_.write("\n");   // placeholder line, overwritten by the first redraw

  for (;;) {
    if (mailbox_.try_receive()) {
      finish_cancelled(cursor);
      report.outcome = timr::model::Outcome::CancelledEarly;
      break;
    }

    auto now = clock_.now();
    if (now > end) {
      finish_completed(cursor);
      report.outcome = timr::model::Outcome::Completed;
      break;
    }

    auto since = now - last_update;
    if (since < opts_.interval) {
      // Sleep only the deficit to the next tick boundary
      clock_.sleep_for(opts_.interval - since);
      continue;
    }

    redraw(now, start, end);
    ++report.redraws;
    last_update = now;
  }

  if (opts_.debug) {
    std::fprintf(stderr, "timr: countdown: %s after %llu redraws\n",
                 report.outcome == timr::model::Outcome::Completed ? "completed" : "cancelled",
                 static_cast<unsigned long long>(report.redraws));
  }
  return report;
}

void Countdown::redraw(ITickClock::time_point now, ITickClock::time_point start, ITickClock::time_point end) {
  auto s = sample_progress(now - start, end - start, end - now, term_.columns());

  term_.previous_line();
  term_.clear_line();

  std::string line;
  if (opts_.clock_label) {
    auto label = opts_.clock_label();
    if (!label.empty()) line = label + " - ";
  }
  line += timr::ui::format_remaining(s.remaining_s);
  line += '\n';
  term_.write(line);

  term_.clear_line();
  term_.write(timr::ui::compose_bar(term_, s, opts_.bar));

  term_.report_progress(s.percent);
  term_.flush();
}

void Countdown::finish_completed(timr::ui::CursorGuard& cursor) {
  term_.previous_line();
  term_.clear_line();
  term_.clear_progress();
  if (opts_.bell) term_.bell();
  cursor.restore();
  term_.write("Finished!\n");
  term_.clear_line();
  term_.flush();
}

void Countdown::finish_cancelled(timr::ui::CursorGuard& cursor) {
  cursor.restore();
  term_.clear_line();
  term_.clear_progress();
  term_.write("Exiting early!\n");
  term_.flush();
}

} // namespace timr::app
