#include <mihomoctl/error.hpp>
#include <mihomoctl/pointer.hpp>
#include <mihomoctl/service_manager.hpp>
#include <mihomoctl/version_manager.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace mihomoctl {

VersionManager::VersionManager(HomeContext home, Downloader downloader, RunningProbe probe)
    : home_(home), store_(home), downloader_(std::move(downloader)), probe_(std::move(probe)) {
  if (!probe_) {
    probe_ = [h = home_]() { return ServiceManager::running_record(h); };
  }
}

Version VersionManager::install(const std::string &spec) {
  std::string version = spec;
  if (auto ch = parse_channel(spec.empty() ? "stable" : spec)) {
    try {
      version = downloader_.resolve(*ch);
    } catch (const Error &e) {
      Error::wrap(e, std::string("resolve ") + channel_name(*ch));
    }
  }
  if (!valid_key(version) || version == "default")
    throw ValidationError("invalid version identifier '" + version + "'");

  if (auto v = store_.find(version)) {
    spdlog::info("[version={}] already installed", version);
    return *v;
  }

  store_.sweep_staging();
  const auto staging = store_.create_staging(version);
  try {
    downloader_.fetch(version, staging, VersionStore::kBinaryName);
    store_.publish(staging, version);
  } catch (const Error &e) {
    store_.discard(staging);
    Error::wrap(e, "install " + version);
  }

  auto v = store_.find(version);
  if (!v) throw IOError("version " + version + " vanished right after install");
  return *v;
}

void VersionManager::set_default(const std::string &version) {
  store_.set_default(version);
  spdlog::info("[version={}] set as default", version);
}

static bool same_path(const fs::path &a, const fs::path &b) {
  std::error_code e1, e2;
  auto ca = fs::weakly_canonical(a, e1);
  auto cb = fs::weakly_canonical(b, e2);
  return (e1 ? a : ca) == (e2 ? b : cb);
}

void VersionManager::uninstall(const std::string &version) {
  auto v = store_.find(version);
  if (!v) throw NotFoundError("version " + version + " is not installed");

  if (auto rec = probe_()) {
    if (same_path(rec->binary.parent_path(), v->dir))
      throw ConflictError("version " + version + " is backing the running service (pid " +
                          std::to_string(rec->pid) + "); stop it first");
  }
  store_.remove(version);
  spdlog::info("[version={}] uninstalled", version);
}

std::vector<Version> VersionManager::list() const { return store_.list(); }

Version VersionManager::default_version() const {
  auto id = store_.default_id();
  if (!id) {
    if (store_.list().empty()) throw NotFoundError("no version installed; run `mihomoctl install`");
    throw NotFoundError("no default version set; run `mihomoctl default <version>`");
  }
  auto v = store_.find(*id);
  if (!v) throw NotFoundError("default version " + *id + " is not installed");
  return *v;
}

fs::path VersionManager::binary_path(const std::optional<std::string> &version) const {
  if (!version) return default_version().binary;
  auto v = store_.find(*version);
  if (!v) throw NotFoundError("version " + *version + " is not installed");
  return v->binary;
}

std::vector<RemoteRelease> VersionManager::list_remote(int limit) const {
  return downloader_.list_remote(limit);
}

} // namespace mihomoctl
