#pragma once
#include "home.hpp"
#include "pointer.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

struct Version {
  std::string id;
  std::filesystem::path dir;
  std::filesystem::path binary;
  std::int64_t installed_at = 0; // unix seconds
  bool is_default = false;
};

// versions/<id>/ directories plus the versions/default pointer.
// A directory is visible only once it holds both the binary and the
// .installed marker; both are written in staging before the rename.
class VersionStore {
public:
  static constexpr const char *kBinaryName = "mihomo";
  static constexpr const char *kMarker = ".installed";

  explicit VersionStore(HomeContext home);

  std::vector<Version> list() const;
  std::optional<Version> find(const std::string &id) const;
  bool is_published(const std::string &id) const;

  std::filesystem::path create_staging(const std::string &id) const;
  // true if this call published `id`, false if an identical install won.
  bool publish(const std::filesystem::path &staging, const std::string &id) const;
  void discard(const std::filesystem::path &staging) const;
  // Removes staging leftovers whose owning pid is gone.
  void sweep_staging() const;

  void remove(const std::string &id) const;

  // Never returns a key that is not installed.
  std::optional<std::string> default_id() const;
  void set_default(const std::string &id) const;
  void clear_default() const;

private:
  std::optional<Version> load(const std::filesystem::path &dir) const;
  std::filesystem::path staging_name(const std::string &prefix) const;

  HomeContext home_;
  AtomicPointer default_;
};

} // namespace mihomoctl
