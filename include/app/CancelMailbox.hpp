#pragma once
#include <atomic>

namespace timr::app {

// Single-slot, one-shot handoff: one producer (interrupt thread) posts,
// one consumer (render loop) polls without blocking.
class CancelMailbox {
public:
  CancelMailbox() = default;
  CancelMailbox(const CancelMailbox&) = delete;
  CancelMailbox& operator=(const CancelMailbox&) = delete;

  void post() noexcept { slot_.store(true, std::memory_order_release); }

  [[nodiscard]] bool try_receive() const noexcept { return slot_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> slot_{false};
  static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace timr::app
