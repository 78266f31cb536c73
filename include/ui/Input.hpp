#pragma once

#include <atomic>
#include <istream>
#include <string>

namespace seagreen::ui {

enum class ReadStatus { Line, EndOfInput, Interrupted };

// Where the command loop gets its lines from
class ILineSource {
public:
  virtual ~ILineSource() = default;
  [[nodiscard]] virtual ReadStatus read_line(std::string& out) = 0;
};

// Plain std::istream; never reports Interrupted
class StreamLineSource : public ILineSource {
public:
  explicit StreamLineSource(std::istream& in) : in_(in) {}
  ReadStatus read_line(std::string& out) override;
private:
  std::istream& in_;
};

// Reads a file descriptor with poll() so a pending SIGINT flag is noticed
// while waiting at the prompt
class FdLineSource : public ILineSource {
public:
  FdLineSource(int fd, std::atomic<bool>& interrupted) : fd_(fd), interrupted_(interrupted) {}
  ReadStatus read_line(std::string& out) override;
private:
  int fd_;
  std::atomic<bool>& interrupted_;
  std::string pending_;
  bool eof_{false};
};

// True when a read() on fd will not block: data, hangup or an fd error
[[nodiscard]] bool has_input_available(int fd, int timeout_ms);

} // namespace seagreen::ui
