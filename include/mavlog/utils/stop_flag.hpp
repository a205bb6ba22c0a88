#pragma once
#include <atomic>

namespace mavlog::utils {

/**
 * @brief Shutdown request shared between the recorder loop and its signal handler.
 *
 * The recorder polls stop_requested() once per cycle, so a request lets the
 * current cycle finish before the log is closed. stop_signal() keeps the
 * number of the signal that asked for the stop (0 when requested from code).
 */
class StopFlag {
public:
  void request_stop(int signal_number = 0) noexcept {
    signal_.store(signal_number, std::memory_order_relaxed);
    stop_.store(true, std::memory_order_release);
  }
  bool stop_requested() const noexcept { return stop_.load(std::memory_order_acquire); }
  int stop_signal() const noexcept { return signal_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> stop_{false};
  std::atomic<int> signal_{0};
};

} // namespace mavlog::utils
