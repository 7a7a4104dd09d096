#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/version_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mihomoctl {

static bool pid_alive(long pid) {
  if (pid <= 0) return false;
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

VersionStore::VersionStore(HomeContext home)
    : home_(std::move(home)), default_(home_.versions_dir() / "default") {}

std::optional<Version> VersionStore::load(const fs::path &dir) const {
  std::error_code ec;
  Version v;
  v.id = dir.filename().string();
  v.dir = dir;
  v.binary = dir / kBinaryName;
  if (!fs::is_regular_file(v.binary, ec))
    return std::nullopt;
  auto marker = io::read_file(dir / kMarker);
  if (!marker)
    return std::nullopt;
  char *end = nullptr;
  long long ts = std::strtoll(marker->c_str(), &end, 10);
  if (end == marker->c_str())
    return std::nullopt;
  v.installed_at = ts;
  return v;
}

std::vector<Version> VersionStore::list() const {
  std::vector<Version> out;
  std::error_code ec;
  const auto base = home_.versions_dir();
  if (!fs::exists(base, ec))
    return out;

  for (auto &e : fs::directory_iterator(base, ec)) {
    if (!e.is_directory(ec))
      continue;
    auto name = e.path().filename().string();
    if (!valid_key(name))
      continue;
    if (auto v = load(e.path()))
      out.push_back(std::move(*v));
  }
  if (ec)
    throw IOError("list " + base.string() + ": " + ec.message());

  auto def = default_id();
  for (auto &v : out)
    v.is_default = def && *def == v.id;

  std::sort(out.begin(), out.end(), [](const Version &a, const Version &b) {
    if (a.installed_at != b.installed_at)
      return a.installed_at < b.installed_at;
    return a.id < b.id;
  });
  return out;
}

std::optional<Version> VersionStore::find(const std::string &id) const {
  if (!valid_key(id) || id == "default")
    return std::nullopt;
  auto v = load(home_.versions_dir() / id);
  if (v) {
    auto def = default_.read();
    v->is_default = def && *def == id;
  }
  return v;
}

bool VersionStore::is_published(const std::string &id) const {
  return find(id).has_value();
}

fs::path VersionStore::staging_name(const std::string &prefix) const {
  static std::atomic<unsigned long> seq{0};
  return home_.staging_dir() /
         (prefix + "." + std::to_string(::getpid()) + "." + std::to_string(++seq));
}

fs::path VersionStore::create_staging(const std::string &id) const {
  io::ensure_dir(home_.staging_dir());
  auto dir = staging_name(id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw IOError("create staging " + dir.string() + ": " + ec.message());
  return dir;
}

bool VersionStore::publish(const fs::path &staging, const std::string &id) const {
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  io::atomic_write(staging / kMarker, std::to_string(now) + "\n");
  io::ensure_dir(home_.versions_dir());

  const auto target = home_.versions_dir() / id;
  for (int attempt = 0; attempt < 2; ++attempt) {
    if (::rename(staging.c_str(), target.c_str()) == 0) {
      io::fsync_dir(home_.versions_dir());
      spdlog::info("[version={}] published {}", id, target.string());
      return true;
    }
    int err = errno;
    if (err != ENOTEMPTY && err != EEXIST)
      throw IOError("rename " + staging.string() + " -> " + target.string() + ": " +
                    std::strerror(err));

    if (is_published(id)) {
      spdlog::info("[version={}] already published by a concurrent install", id);
      discard(staging);
      return false;
    }
    // Leftover directory that never completed publishing: move it aside.
    spdlog::warn("[version={}] replacing incomplete directory {}", id, target.string());
    auto trash = staging_name("trash-" + id);
    if (::rename(target.c_str(), trash.c_str()) == 0) {
      std::error_code ec;
      fs::remove_all(trash, ec);
    }
  }
  throw IOError("could not publish " + id + " into " + target.string());
}

void VersionStore::discard(const fs::path &staging) const {
  std::error_code ec;
  fs::remove_all(staging, ec);
  if (ec)
    spdlog::warn("failed to remove staging {}: {}", staging.string(), ec.message());
}

void VersionStore::sweep_staging() const {
  std::error_code ec;
  const auto base = home_.staging_dir();
  if (!fs::exists(base, ec))
    return;
  for (auto &e : fs::directory_iterator(base, ec)) {
    auto name = e.path().filename().string();
    // <prefix>.<pid>.<seq>
    auto last = name.rfind('.');
    if (last == std::string::npos || last == 0)
      continue;
    auto prev = name.rfind('.', last - 1);
    if (prev == std::string::npos)
      continue;
    long pid = std::strtol(name.substr(prev + 1, last - prev - 1).c_str(), nullptr, 10);
    if (pid == ::getpid() || pid_alive(pid))
      continue;
    spdlog::debug("removing stale staging {}", e.path().string());
    std::error_code e2;
    fs::remove_all(e.path(), e2);
  }
}

void VersionStore::remove(const std::string &id) const {
  if (!is_published(id))
    throw NotFoundError("version " + id + " is not installed");

  io::ensure_dir(home_.staging_dir());
  const auto dir = home_.versions_dir() / id;
  const auto trash = staging_name("trash-" + id);
  // Leave the visible namespace first; the delete itself may be slow.
  if (::rename(dir.c_str(), trash.c_str()) != 0)
    throw IOError("rename " + dir.string() + ": " + std::strerror(errno));

  if (auto def = default_.read(); def && *def == id) {
    default_.clear();
    spdlog::info("[version={}] cleared default pointer", id);
  }

  std::error_code ec;
  fs::remove_all(trash, ec);
  if (ec)
    spdlog::warn("[version={}] leftover {}: {}", id, trash.string(), ec.message());
}

std::optional<std::string> VersionStore::default_id() const {
  auto def = default_.read();
  if (!def)
    return std::nullopt;
  if (!load(home_.versions_dir() / *def)) {
    spdlog::warn("default version '{}' is not installed; treating as unset", *def);
    return std::nullopt;
  }
  return def;
}

void VersionStore::set_default(const std::string &id) const {
  if (!is_published(id))
    throw NotFoundError("version " + id + " is not installed");
  default_.write(id);
}

void VersionStore::clear_default() const { default_.clear(); }

} // namespace mihomoctl
