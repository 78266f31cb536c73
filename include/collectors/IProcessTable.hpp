#pragma once
#include "model/Errors.hpp"
#include "model/Process.hpp"
#include <cstdint>
#include <expected>
#include <vector>

namespace seagreen::collectors {

// Read-only view of the OS process table so the engine can be driven by
// /proc in production and by scripted tables in tests.
class IProcessTable {
public:
  virtual ~IProcessTable() = default;

  // Every visible process. Entries that vanish mid-scan are skipped.
  [[nodiscard]] virtual std::vector<seagreen::model::ProcessEntry> list_processes() = 0;

  // Fails with NoSuchProcess or PermissionDenied
  [[nodiscard]] virtual std::expected<seagreen::model::ProcessHandle, seagreen::model::ErrorKind>
  resolve(int32_t pid) = 0;

  // Fails with ProcessGone or PermissionDenied
  [[nodiscard]] virtual std::expected<seagreen::model::RawUsage, seagreen::model::ErrorKind>
  read_usage(const seagreen::model::ProcessHandle& handle) = 0;

  // Unit of RawUsage::cpu_ticks
  [[nodiscard]] virtual double ticks_per_second() const = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace seagreen::collectors
