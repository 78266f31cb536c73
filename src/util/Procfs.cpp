#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace seagreen::util {

static std::string proc_root() {
  const char* env = std::getenv("SEAGREEN_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

// /proc files report st_size 0, so read until EOF rather than trusting stat
static bool slurp(const std::string& path, std::string& out, std::error_code& ec) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) { ec.assign(errno, std::generic_category()); return false; }
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) break;
    if (errno == EINTR) continue;
    // Process exited between open and read
    ec.assign(errno, std::generic_category());
    ::close(fd);
    return false;
  }
  ::close(fd);
  ec.clear();
  return true;
}

auto read_file_string(const std::string& abs, std::error_code& ec) -> std::optional<std::string> {
  std::string s;
  if (!slurp(map_proc_path(abs), s, ec)) return std::nullopt;
  return s;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::error_code ec;
  return read_file_string(abs, ec);
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::string s; std::error_code ec;
  if (!slurp(map_proc_path(abs), s, ec)) return std::nullopt;
  return std::vector<unsigned char>(s.begin(), s.end());
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace seagreen::util
