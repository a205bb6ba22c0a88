#pragma once
/**
 * @file signal_handler.hpp
 * @brief Turns Ctrl-C / SIGTERM during a recording into a StopFlag request.
 *
 * While an instance is alive the recorder is not killed mid-record: the
 * signal only flips the flag, and the loop closes the log after the running
 * cycle. The handlers that were installed before are put back on
 * destruction. One instance at a time.
 */
#include "mavlog/utils/stop_flag.hpp"

#include <csignal>

namespace mavlog::utils {

class SignalHandler {
public:
  explicit SignalHandler(StopFlag& stop) : stop_(stop) {
    instance_ = this;
    prev_int_  = std::signal(SIGINT,  &SignalHandler::on_signal);
    prev_term_ = std::signal(SIGTERM, &SignalHandler::on_signal);
  }

  ~SignalHandler() noexcept {
    std::signal(SIGINT,  prev_int_);
    std::signal(SIGTERM, prev_term_);
    instance_ = nullptr;
  }

  SignalHandler(const SignalHandler&) = delete;
  SignalHandler& operator=(const SignalHandler&) = delete;

private:
  static void on_signal(int sig) {
    if (instance_) instance_->stop_.request_stop(sig);
  }

  using Handler = void (*)(int);

  StopFlag& stop_;
  Handler prev_int_{SIG_DFL};
  Handler prev_term_{SIG_DFL};
  static inline SignalHandler* instance_{nullptr};
};

} // namespace mavlog::utils
