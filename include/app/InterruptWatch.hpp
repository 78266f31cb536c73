#pragma once
#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

namespace seagreen::app {

// Turns an async-signal flag into a std::stop_token for the duration of one
// command. A watcher thread polls the flag; a signal handler cannot call
// request_stop() itself.
class InterruptWatch {
public:
  explicit InterruptWatch(std::atomic<bool>& flag,
                          std::chrono::milliseconds poll = std::chrono::milliseconds(20));
  ~InterruptWatch();
  InterruptWatch(const InterruptWatch&) = delete;
  InterruptWatch& operator=(const InterruptWatch&) = delete;

  // Clears the flag, starts watching and returns a fresh token
  [[nodiscard]] std::stop_token arm();
  void disarm();

private:
  void run(std::stop_token st);

  std::atomic<bool>& flag_;
  std::chrono::milliseconds poll_;
  std::stop_source source_{};
  std::jthread thread_{};
};

} // namespace seagreen::app
