#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mihomoctl {
namespace io {
  void ensure_dir(const std::filesystem::path& p);
  int  open_for_stdout(const std::filesystem::path& path);
  int  open_for_stderr(const std::filesystem::path& path);

  void rotate_logs(const std::filesystem::path& base_path,
                   std::uintmax_t max_bytes,
                   int backups);

  // Unique sibling name "<dir>/.<stem>.<pid>.<seq>" for temporaries.
  std::filesystem::path temp_sibling(const std::filesystem::path& target);

  // Write to a temporary in the same directory, fsync, rename over `target`.
  void atomic_write(const std::filesystem::path& target, const std::string& data,
                    unsigned mode = 0644);

  std::optional<std::string> read_file(const std::filesystem::path& path);

  void fsync_dir(const std::filesystem::path& dir);
}
} // namespace mihomoctl
