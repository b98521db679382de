#pragma once

#include "app/CancelMailbox.hpp"
#include <csignal>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace timr::app {

// Interrupt handling could not be installed
struct SignalError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Blocks SIGINT/SIGTERM for the process and waits for them on a dedicated
// thread; the first one received is posted to the mailbox, then the thread exits.
// Construct before any other thread is started so the mask is inherited.
// stop() (and the destructor) restore the previous mask; call it from the
// constructing thread.
class InterruptWatcher {
public:
  explicit InterruptWatcher(CancelMailbox& mailbox);   // throws SignalError
  ~InterruptWatcher();
  InterruptWatcher(const InterruptWatcher&) = delete;
  InterruptWatcher& operator=(const InterruptWatcher&) = delete;

  void stop();

private:
  void run(std::stop_token st);
  void restore_mask();

  CancelMailbox& mailbox_;
  sigset_t old_mask_{};
  bool mask_saved_{false};
  std::jthread thread_;
};

} // namespace timr::app
