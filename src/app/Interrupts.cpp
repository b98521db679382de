#include "app/Interrupts.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <pthread.h>
#include <string>
#include <system_error>

namespace timr::app {

static sigset_t interrupt_set() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

InterruptWatcher::InterruptWatcher(CancelMailbox& mailbox) : mailbox_(mailbox) {
  sigset_t set = interrupt_set();
  int rc = ::pthread_sigmask(SIG_BLOCK, &set, &old_mask_);
  if (rc != 0) {
    throw SignalError(std::string("failed to block interrupt signals: ") + std::strerror(rc));
  }
  mask_saved_ = true;
  try {
    thread_ = std::jthread([this](std::stop_token st){ run(st); });
  } catch (const std::system_error& e) {
    restore_mask();
    throw SignalError(std::string("failed to start interrupt thread: ") + e.what());
  }
}

InterruptWatcher::~InterruptWatcher() { stop(); }

void InterruptWatcher::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  restore_mask();
}

void InterruptWatcher::restore_mask() {
  if (!mask_saved_) return;
  mask_saved_ = false;
  int rc = ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  if (rc != 0) {
    std::fprintf(stderr, "timr: interrupts: failed to restore signal mask: %s\n", std::strerror(rc));
  }
}

void InterruptWatcher::run(std::stop_token st) {
  sigset_t set = interrupt_set();
  // Short timeout so stop requests are noticed promptly
  const timespec wait{0, 50 * 1000 * 1000};
  while (!st.stop_requested()) {
    int sig = ::sigtimedwait(&set, nullptr, &wait);
    if (sig > 0) {
      mailbox_.post();
      return;
    }
    if (errno == EAGAIN || errno == EINTR) continue;
    std::fprintf(stderr, "timr: interrupts: sigtimedwait failed: %s\n", std::strerror(errno));
    return;
  }
}

} // namespace timr::app
