#include "app/CancelMailbox.hpp"
#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Countdown.hpp"
#include "app/Interrupts.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"

#include <cstdio>
#include <optional>

int main(int argc, char** argv) {
  auto args = timr::app::parse_args(argc, argv);
  switch (args.action) {
    case timr::app::CliAction::Help:
      std::fputs(timr::app::help_text().c_str(), stdout);
      return args.exit_code;
    case timr::app::CliAction::Version:
      std::printf("%s\n", timr::app::version_text().c_str());
      return args.exit_code;
    case timr::app::CliAction::Fail:
      std::fprintf(stderr, "timr: %s\n", args.error.c_str());
      if (args.show_hint) std::printf("Use 'timr --help' for more information\n");
      return args.exit_code;
    case timr::app::CliAction::Run:
      break;
  }

  auto config = timr::app::load_config_file(timr::app::config_file_path());
  if (config.state == timr::app::ConfigState::Unreadable) {
    std::fprintf(stderr, "timr: config: failed to read %s, using defaults\n", config.path.c_str());
  }
  auto cfg = timr::app::resolve_config(config.toml, config.loaded());
  if (cfg.debug) {
    std::fprintf(stderr, "timr: config: %s (%s)\n", config.path.empty() ? "<none>" : config.path.c_str(),
                 config.loaded() ? "loaded" : "not loaded");
  }

  auto duration = timr::app::resolve_duration(args.duration, config);
  if (!duration.ok) {
    std::fprintf(stderr, "timr: %s\n", duration.error.c_str());
    return duration.exit_code;
  }

  timr::app::CancelMailbox mailbox;
  std::optional<timr::app::InterruptWatcher> watcher;
  try {
    watcher.emplace(mailbox);
  } catch (const timr::app::SignalError& e) {
    std::fprintf(stderr, "timr: Error setting Ctrl-C handler: %s\n", e.what());
    return 1;
  }

  timr::ui::AnsiTerminal term(stdout, timr::ui::color_enabled_for(stdout),
                             timr::ui::progress_report_enabled_for(stdout, cfg.progress_report));
  timr::app::SteadyTickClock clock;

  timr::app::CountdownOptions opts;
  opts.bar = timr::ui::use_unicode() ? cfg.bar : timr::ui::ascii_bar_style(cfg.bar);
  opts.bell = cfg.bell;
  opts.debug = cfg.debug;
  opts.clock_label = [style = cfg.clock]{ return timr::ui::format_time_now(style); };

  try {
    timr::app::Countdown countdown(term, clock, mailbox, opts);
    (void)countdown.run(duration.value);
  } catch (const timr::ui::IoError& e) {
    std::fprintf(stderr, "timr: %s\n", e.what());
    return 1;
  }
  return 0;
}
