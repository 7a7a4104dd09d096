#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace mihomoctl {

struct SpawnSpec {
  std::filesystem::path binary;
  std::filesystem::path config;
  std::filesystem::path logs_dir;
  std::uintmax_t log_max_bytes = 5 * 1024 * 1024;
};

// Raw process control: fork/exec, signals, liveness. Holds no state.
class ProcessRunner {
public:
  // `<binary> -d <config dir> -f <config>` in a new session with output
  // appended to <logs>/mihomo.out|.err. Returns once exec succeeded;
  // ProcessError if fork or exec failed.
  static int spawn(const SpawnSpec &spec);

  // Exit code if `pid` is our child and has exited (it is reaped).
  static std::optional<int> reap(int pid);

  static bool alive(int pid);

  // Alive and, where /proc tells, running `binary`.
  static bool owned(int pid, const std::filesystem::path &binary);

  // SIGTERM, wait up to `grace`, then SIGKILL and wait up to `kill_wait`.
  // true once the process is gone.
  static bool terminate(int pid, std::chrono::milliseconds grace,
                        std::chrono::milliseconds kill_wait);
};

} // namespace mihomoctl
