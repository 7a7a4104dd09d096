#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace mihomoctl {

// Pointer file holding a single key (version id, profile name). Replaced by
// write-temp-then-rename, so readers see either the old or the new value.
class AtomicPointer {
public:
  explicit AtomicPointer(std::filesystem::path file) : file_(std::move(file)) {}

  std::optional<std::string> read() const;
  void write(const std::string &key) const;
  void clear() const;

  const std::filesystem::path &file() const { return file_; }

private:
  std::filesystem::path file_;
};

// Keys are plain file names: [A-Za-z0-9._-], no leading dot.
bool valid_key(const std::string &key);

} // namespace mihomoctl
