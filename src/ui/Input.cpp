#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>
#include <cerrno>

namespace seagreen::ui {

bool has_input_available(int fd, int timeout_ms) {
  struct pollfd pfd{.fd=fd,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  // A closed or broken fd also counts: read() then reports the failure
  return rv > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL));
}

ReadStatus StreamLineSource::read_line(std::string& out) {
  if (!std::getline(in_, out)) return ReadStatus::EndOfInput;
  return ReadStatus::Line;
}

ReadStatus FdLineSource::read_line(std::string& out) {
  for (;;) {
    auto nl = pending_.find('\n');
    if (nl != std::string::npos) {
      out = pending_.substr(0, nl);
      pending_.erase(0, nl + 1);
      return ReadStatus::Line;
    }
    if (eof_) {
      // Last line without a trailing newline
      if (pending_.empty()) return ReadStatus::EndOfInput;
      out = std::move(pending_);
      pending_.clear();
      return ReadStatus::Line;
    }
    if (interrupted_.exchange(false)) return ReadStatus::Interrupted;
    if (!has_input_available(fd_, 100)) continue;
    char buf[256];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n > 0) { pending_.append(buf, static_cast<size_t>(n)); continue; }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    eof_ = true;
  }
}

} // namespace seagreen::ui
