#include "collectors/ProcfsProcessTable.hpp"
#include "util/Diag.hpp"
#include "util/Procfs.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <unistd.h>

using seagreen::model::ErrorKind;

namespace seagreen::collectors {

ProcfsProcessTable::ProcfsProcessTable() {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) ticks_per_second_ = static_cast<double>(hz);
  long ps = ::sysconf(_SC_PAGESIZE);
  if (ps > 0) page_size_ = static_cast<uint64_t>(ps);
}

std::string ProcfsProcessTable::stat_path(int32_t pid) {
  return std::string("/proc/") + std::to_string(pid) + "/stat";
}

ErrorKind ProcfsProcessTable::classify_read_error(const std::error_code& ec, bool resolving) {
  if (ec.value() == EACCES || ec.value() == EPERM) return ErrorKind::PermissionDenied;
  return resolving ? ErrorKind::NoSuchProcess : ErrorKind::ProcessGone;
}

bool ProcfsProcessTable::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may itself contain ')' or spaces; the last ')' closes it
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  ss >> out.state;
  // ppid..cmajflt (fields 4-13)
  for (int i = 0; i < 10; i++) { std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // cutime..itrealvalue (fields 16-21)
  for (int i = 0; i < 6; i++) { std::string tmp; ss >> tmp; }
  ss >> out.start_time;
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes; // discard vsize
  ss >> out.rss_pages;
  return !ss.fail();
}

std::string ProcfsProcessTable::read_cmdline(int32_t pid) {
  auto bytes = seagreen::util::read_file_bytes(std::string("/proc/") + std::to_string(pid) + "/cmdline");
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) { if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } } else { out.push_back(static_cast<char>(b)); sep = false; } }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::vector<seagreen::model::ProcessEntry> ProcfsProcessTable::list_processes() {
  std::vector<seagreen::model::ProcessEntry> out;
  for (auto& name : seagreen::util::list_dir("/proc")) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue; // numeric
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    auto content = seagreen::util::read_file_string(stat_path(pid));
    StatFields f;
    if (!content || !parse_stat_line(*content, f)) continue; // exited during scan
    seagreen::model::ProcessEntry e;
    e.pid = pid;
    e.name = f.comm;
    e.cmd = read_cmdline(pid);
    if (e.cmd.empty()) e.cmd = "[" + f.comm + "]"; // kernel thread or zombie
    out.push_back(std::move(e));
  }
  return out;
}

std::expected<seagreen::model::ProcessHandle, ErrorKind> ProcfsProcessTable::resolve(int32_t pid) {
  if (pid <= 0) return std::unexpected(ErrorKind::NoSuchProcess);
  std::error_code ec;
  auto content = seagreen::util::read_file_string(stat_path(pid), ec);
  if (!content) {
    seagreen::util::debugf("procfs", "resolve %d: %s", pid, ec.message().c_str());
    return std::unexpected(classify_read_error(ec, true));
  }
  StatFields f;
  if (!parse_stat_line(*content, f) || f.state == 'Z' || f.state == 'X')
    return std::unexpected(ErrorKind::NoSuchProcess);
  return seagreen::model::ProcessHandle{pid, f.comm, f.start_time};
}

std::expected<seagreen::model::RawUsage, ErrorKind>
ProcfsProcessTable::read_usage(const seagreen::model::ProcessHandle& handle) {
  std::error_code ec;
  auto content = seagreen::util::read_file_string(stat_path(handle.pid), ec);
  if (!content) return std::unexpected(classify_read_error(ec, false));
  StatFields f;
  if (!parse_stat_line(*content, f)) return std::unexpected(ErrorKind::ProcessGone);
  // Exited but not yet reaped, or the pid now belongs to someone else
  if (f.state == 'Z' || f.state == 'X' || f.start_time != handle.start_time)
    return std::unexpected(ErrorKind::ProcessGone);
  seagreen::model::RawUsage u;
  u.cpu_ticks = f.utime + f.stime;
  u.rss_bytes = f.rss_pages > 0 ? static_cast<uint64_t>(f.rss_pages) * page_size_ : 0;
  return u;
}

} // namespace seagreen::collectors
