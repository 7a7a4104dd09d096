#pragma once
#include "downloader.hpp"
#include "home.hpp"
#include "state.hpp"
#include "version_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

class VersionManager {
public:
  // Without a probe, ServiceManager::running_record(home) is used.
  VersionManager(HomeContext home, Downloader downloader, RunningProbe probe = {});

  // `stable`, `beta`, `nightly` (or empty, meaning stable) resolve through the
  // release feed; anything else is a version tag. Installing an installed
  // version returns it without fetching anything.
  Version install(const std::string &version_or_channel);

  void set_default(const std::string &version);
  void uninstall(const std::string &version);

  std::vector<Version> list() const;
  // NotFoundError when no default is set.
  Version default_version() const;
  std::filesystem::path binary_path(const std::optional<std::string> &version = std::nullopt) const;

  std::vector<RemoteRelease> list_remote(int limit) const;

  const VersionStore &store() const { return store_; }

private:
  HomeContext home_;
  VersionStore store_;
  Downloader downloader_;
  RunningProbe probe_;
};

} // namespace mihomoctl
