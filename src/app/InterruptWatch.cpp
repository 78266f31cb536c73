#include "app/InterruptWatch.hpp"
#include "util/Diag.hpp"

namespace seagreen::app {

InterruptWatch::InterruptWatch(std::atomic<bool>& flag, std::chrono::milliseconds poll)
  : flag_(flag), poll_(poll) {}

InterruptWatch::~InterruptWatch() { disarm(); }

std::stop_token InterruptWatch::arm() {
  disarm();
  flag_.store(false);
  source_ = std::stop_source{};
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return source_.get_token();
}

void InterruptWatch::disarm() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  // A late Ctrl+C belongs to the finished command, not the prompt
  flag_.store(false);
}

void InterruptWatch::run(std::stop_token st) {
  while (!st.stop_requested()) {
    if (flag_.exchange(false)) {
      seagreen::util::debugf("interrupt", "stop requested");
      source_.request_stop();
      return;
    }
    std::this_thread::sleep_for(poll_);
  }
}

} // namespace seagreen::app
