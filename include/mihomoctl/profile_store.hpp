#pragma once
#include "home.hpp"
#include "pointer.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

struct Profile {
  std::string name;
  std::filesystem::path path;
  // unix seconds; recorded on first write, file mtime for profiles added by hand
  std::int64_t created_at = 0;
  bool active = false;
};

// configs/<name>.yaml files plus the configs/current pointer.
class ProfileStore {
public:
  explicit ProfileStore(HomeContext home);

  // Sorted by name.
  std::vector<Profile> list() const;
  std::optional<Profile> find(const std::string &name) const;

  // ValidationError for names that cannot be stored.
  std::filesystem::path path_for(const std::string &name) const;

  void write(const std::string &name, const std::string &content) const;
  // Clears `current` when it named this profile.
  void remove(const std::string &name) const;

  // Never returns a name that has no file.
  std::optional<std::string> current() const;
  void set_current(const std::string &name) const;
  void clear_current() const;

private:
  std::optional<Profile> load(const std::filesystem::path &file) const;

  HomeContext home_;
  AtomicPointer current_;
};

bool valid_profile_name(const std::string &name);

} // namespace mihomoctl
