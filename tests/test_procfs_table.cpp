#include "minitest.hpp"
#include "collectors/ProcfsProcessTable.hpp"
#include "util/Procfs.hpp"
#include <filesystem>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

using namespace std;
namespace fs = std::filesystem;
using seagreen::collectors::ProcfsProcessTable;
using seagreen::model::ErrorKind;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("seagreen_test_procfs_") + tag) /
              fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  return root;
}

static string stat_line(int pid, const string& comm, char state, uint64_t utime, uint64_t stime,
                        uint64_t start, int64_t rss_pages) {
  return to_string(pid) + " (" + comm + ") " + state +
         " 1 1 1 0 -1 4194304 100 0 0 0 " + to_string(utime) + " " + to_string(stime) +
         " 0 0 20 0 1 0 " + to_string(start) + " 12345678 " + to_string(rss_pages) + " 18446744073709551615\n";
}

static void write_proc(const fs::path& root, int pid, const string& stat, const string& cmdline) {
  auto dir = root / "proc" / to_string(pid);
  fs::create_directories(dir);
  ofstream(dir / "stat") << stat;
  ofstream(dir / "cmdline", ios::binary) << cmdline;
}

TEST(procfs_parse_stat_handles_odd_comm) {
  ProcfsProcessTable::StatFields f;
  ASSERT_TRUE(ProcfsProcessTable::parse_stat_line(stat_line(77, "we ird) (name", 'S', 12, 8, 5000, 256), f));
  ASSERT_EQ(f.comm, string("we ird) (name"));
  ASSERT_EQ(f.state, 'S');
  ASSERT_EQ(f.utime, 12u);
  ASSERT_EQ(f.stime, 8u);
  ASSERT_EQ(f.start_time, 5000u);
  ASSERT_EQ(f.rss_pages, 256);
  ASSERT_TRUE(!ProcfsProcessTable::parse_stat_line("garbage", f));
  ASSERT_TRUE(!ProcfsProcessTable::parse_stat_line("12 (short) R 1 2", f));
}

TEST(procfs_table_resolves_and_reads_usage) {
  auto root = make_root("usage");
  write_proc(root, 4321, stat_line(4321, "python3", 'R', 300, 200, 9000, 100), string("python3\0app.py\0", 15));
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  ProcfsProcessTable table;
  auto h = table.resolve(4321);
  ASSERT_TRUE(h.has_value());
  ASSERT_EQ(h->name, string("python3"));
  ASSERT_EQ(h->start_time, 9000u);
  auto u = table.read_usage(*h);
  ASSERT_TRUE(u.has_value());
  ASSERT_EQ(u->cpu_ticks, 500u);
  ASSERT_EQ(u->rss_bytes, 100u * static_cast<uint64_t>(::sysconf(_SC_PAGESIZE)));
  ASSERT_TRUE(table.ticks_per_second() > 0.0);
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_table_missing_pid_is_no_such_process) {
  auto root = make_root("missing");
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  ProcfsProcessTable table;
  auto h = table.resolve(99999999);
  ASSERT_TRUE(!h.has_value());
  ASSERT_TRUE(h.error() == ErrorKind::NoSuchProcess);
  ASSERT_TRUE(table.resolve(0).error() == ErrorKind::NoSuchProcess);
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_table_zombie_does_not_resolve) {
  auto root = make_root("zombie");
  write_proc(root, 55, stat_line(55, "defunct", 'Z', 1, 1, 10, 0), "");
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  ProcfsProcessTable table;
  ASSERT_TRUE(table.resolve(55).error() == ErrorKind::NoSuchProcess);
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_table_detects_exit_mid_session) {
  auto root = make_root("exit");
  write_proc(root, 600, stat_line(600, "worker", 'S', 1, 1, 700, 10), "worker\0");
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  ProcfsProcessTable table;
  auto h = table.resolve(600);
  ASSERT_TRUE(h.has_value());

  // Exited, not yet reaped
  write_proc(root, 600, stat_line(600, "worker", 'Z', 1, 1, 700, 0), "");
  ASSERT_TRUE(table.read_usage(*h).error() == ErrorKind::ProcessGone);

  // Pid reused by a newer process
  write_proc(root, 600, stat_line(600, "other", 'S', 0, 0, 9999, 10), "other\0");
  ASSERT_TRUE(table.read_usage(*h).error() == ErrorKind::ProcessGone);

  // Entry gone entirely
  fs::remove_all(root / "proc" / "600");
  ASSERT_TRUE(table.read_usage(*h).error() == ErrorKind::ProcessGone);
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_table_lists_processes_with_cmdline) {
  auto root = make_root("list");
  write_proc(root, 10, stat_line(10, "python3", 'S', 1, 1, 5, 1), string("python3\0-m\0http.server\0", 23));
  write_proc(root, 11, stat_line(11, "kworker/0:1", 'I', 0, 0, 2, 0), "");
  fs::create_directories(root / "proc" / "self_not_numeric");
  ofstream(root / "proc" / "meminfo") << "MemTotal: 1 kB\n";
  fs::create_directories(root / "proc" / "12"); // vanished mid-scan: no stat
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  ProcfsProcessTable table;
  auto procs = table.list_processes();
  ASSERT_EQ(procs.size(), 2u);
  std::sort(procs.begin(), procs.end(), [](const auto& a, const auto& b){ return a.pid < b.pid; });
  ASSERT_EQ(procs[0].name, string("python3"));
  ASSERT_EQ(procs[0].cmd, string("python3 -m http.server"));
  ASSERT_EQ(procs[1].cmd, string("[kworker/0:1]"));
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_read_file_reports_errno) {
  auto root = make_root("errno");
  setenv("SEAGREEN_PROC_ROOT", root.c_str(), 1);
  std::error_code ec;
  auto v = seagreen::util::read_file_string("/proc/424242/stat", ec);
  ASSERT_TRUE(!v.has_value());
  ASSERT_EQ(ec.value(), ENOENT);
  unsetenv("SEAGREEN_PROC_ROOT");
}

TEST(procfs_read_errors_map_to_error_kinds) {
  auto classify = [](int err, bool resolving) {
    return ProcfsProcessTable::classify_read_error(std::error_code(err, std::generic_category()), resolving);
  };
  ASSERT_TRUE(classify(EACCES, true) == ErrorKind::PermissionDenied);
  ASSERT_TRUE(classify(EPERM, true) == ErrorKind::PermissionDenied);
  ASSERT_TRUE(classify(EACCES, false) == ErrorKind::PermissionDenied);
  ASSERT_TRUE(classify(EPERM, false) == ErrorKind::PermissionDenied);
  ASSERT_TRUE(classify(ENOENT, true) == ErrorKind::NoSuchProcess);
  ASSERT_TRUE(classify(ESRCH, true) == ErrorKind::NoSuchProcess);
  ASSERT_TRUE(classify(ENOENT, false) == ErrorKind::ProcessGone);
  ASSERT_TRUE(classify(ESRCH, false) == ErrorKind::ProcessGone);
}
