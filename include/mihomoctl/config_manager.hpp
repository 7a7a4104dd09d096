#pragma once
#include "home.hpp"
#include "profile_store.hpp"
#include "state.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

// Where the current profile's external controller listens.
struct ControllerEndpoint {
  std::string url; // http://host:port
  std::string secret;
};

class ConfigManager {
public:
  // Without a probe, ServiceManager::running_record(home) is used.
  explicit ConfigManager(HomeContext home, RunningProbe probe = {});

  // Creates configs/default.yaml when no profile exists and points
  // `current` at `default` when it is unset. Returns the current profile.
  std::optional<Profile> ensure_default_config();

  // Adds a missing external-controller (first free port from 9090 on
  // 127.0.0.1) and secret to the current profile. The file is rewritten only
  // when something was missing.
  ControllerEndpoint ensure_external_controller();

  // NotFoundError when the current profile has no external-controller.
  ControllerEndpoint controller() const;

  void set_current(const std::string &name);
  // NotFoundError when no current profile is set.
  std::filesystem::path get_current_path() const;

  // Structural check; ValidationError names the offending key.
  void validate(const std::filesystem::path &path) const;
  static void validate_content(const std::string &content, const std::string &what);

  std::vector<Profile> list_profiles() const;
  std::string load(const std::string &name) const;
  void save(const std::string &name, const std::string &content);
  void delete_profile(const std::string &name);

  const ProfileStore &store() const { return store_; }

private:
  HomeContext home_;
  ProfileStore store_;
  RunningProbe probe_;
};

// http://host:port for a "host:port" controller address; wildcard hosts map
// to 127.0.0.1.
std::string controller_url(const std::string &address);

} // namespace mihomoctl
