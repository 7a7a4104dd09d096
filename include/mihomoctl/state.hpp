#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mihomoctl {

// Last spawned instance. Presence of the file does not mean it is alive.
struct PidRecord {
  int pid = -1;
  std::int64_t started_at = 0; // unix seconds
  std::filesystem::path binary;
  std::filesystem::path config;
};

// Reports the record of the running instance, if any.
using RunningProbe = std::function<std::optional<PidRecord>()>;

// mihomo.pid: bare pid on the first line, key=value lines after it.
struct PidStore {
  // nullopt when absent. A malformed file reads as a record with pid -1 so
  // reconciliation treats it as stale.
  static std::optional<PidRecord> read(const std::filesystem::path &f);
  static void write(const std::filesystem::path &f, const PidRecord &r);
  static void remove(const std::filesystem::path &f);
};

} // namespace mihomoctl
