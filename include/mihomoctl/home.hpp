#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace mihomoctl {

// Base storage directory, resolved once per invocation and handed to every
// component that touches disk.
class HomeContext {
public:
  explicit HomeContext(std::filesystem::path root);

  // override -> $MIHOMO_HOME -> $XDG_CONFIG_HOME/mihomoctl -> ~/.config/mihomoctl
  static HomeContext resolve(const std::optional<std::filesystem::path> &override_dir = std::nullopt);

  const std::filesystem::path &root() const { return root_; }

  std::filesystem::path versions_dir() const { return root_ / "versions"; }
  std::filesystem::path configs_dir() const { return root_ / "configs"; }
  std::filesystem::path staging_dir() const { return root_ / ".staging"; }
  std::filesystem::path logs_dir() const { return root_ / "logs"; }
  std::filesystem::path settings_file() const { return root_ / "config.toml"; }
  std::filesystem::path pid_file() const { return root_ / "mihomo.pid"; }

  // Creates the directory skeleton; IOError on failure.
  void ensure_layout() const;

private:
  std::filesystem::path root_;
};

} // namespace mihomoctl
