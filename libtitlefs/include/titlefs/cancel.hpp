#pragma once

#include <atomic>

namespace titlefs {

// Cooperative cancellation flag. Set by whoever drives a long operation
// (another thread, a signal handler), polled by the operation at its safe
// points. Nothing is interrupted: the step in progress runs to completion.
class cancel_token {
 public:
  cancel_token() = default;
  cancel_token(const cancel_token &) = delete;
  cancel_token &operator=(const cancel_token &) = delete;

  void cancel() noexcept { m_flag.store(true, std::memory_order_relaxed); }

  void reset() noexcept { m_flag.store(false, std::memory_order_relaxed); }

  [[nodiscard]] bool cancelled() const noexcept {
    return m_flag.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> m_flag{false};

  static_assert(std::atomic<bool>::is_always_lock_free);
};

}  // namespace titlefs
