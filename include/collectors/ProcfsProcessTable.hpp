#pragma once
#include "collectors/IProcessTable.hpp"
#include <string>
#include <system_error>

namespace seagreen::collectors {

class ProcfsProcessTable : public IProcessTable {
public:
  ProcfsProcessTable();
  const char* name() const override { return "/proc process table"; }
  std::vector<seagreen::model::ProcessEntry> list_processes() override;
  std::expected<seagreen::model::ProcessHandle, seagreen::model::ErrorKind> resolve(int32_t pid) override;
  std::expected<seagreen::model::RawUsage, seagreen::model::ErrorKind>
  read_usage(const seagreen::model::ProcessHandle& handle) override;
  double ticks_per_second() const override { return ticks_per_second_; }

  // Fields of /proc/<pid>/stat this table cares about
  struct StatFields {
    std::string comm;
    char     state{'?'};
    uint64_t utime{};
    uint64_t stime{};
    uint64_t start_time{};
    int64_t  rss_pages{};
  };
  [[nodiscard]] static bool parse_stat_line(const std::string& content, StatFields& out);

  // errno of a failed stat read: EACCES/EPERM are PermissionDenied, anything
  // else means the process is missing (resolving) or has exited (reading)
  [[nodiscard]] static seagreen::model::ErrorKind classify_read_error(const std::error_code& ec, bool resolving);

private:
  double ticks_per_second_{100.0};
  uint64_t page_size_{4096};

  static std::string read_cmdline(int32_t pid);
  static std::string stat_path(int32_t pid);
};

} // namespace seagreen::collectors
