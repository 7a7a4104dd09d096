#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/profile_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mihomoctl {

static constexpr const char *kExt = ".yaml";

// configs/.<name>.created holds the creation time; names never start with '.'
static fs::path created_marker(const fs::path &file) {
  return file.parent_path() / ("." + file.stem().string() + ".created");
}

static std::int64_t now_seconds() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

bool valid_profile_name(const std::string &name) {
  return valid_key(name) && name != "current";
}

ProfileStore::ProfileStore(HomeContext home)
    : home_(std::move(home)), current_(home_.configs_dir() / "current") {}

fs::path ProfileStore::path_for(const std::string &name) const {
  if (!valid_profile_name(name)) throw ValidationError("invalid profile name '" + name + "'");
  return home_.configs_dir() / (name + kExt);
}

std::optional<Profile> ProfileStore::load(const fs::path &file) const {
  struct stat st {};
  if (::stat(file.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return std::nullopt;
  Profile p;
  p.name = file.stem().string();
  p.path = file;
  p.created_at = static_cast<std::int64_t>(st.st_mtime);
  if (auto marker = io::read_file(created_marker(file))) {
    char *end = nullptr;
    long long ts = std::strtoll(marker->c_str(), &end, 10);
    if (end != marker->c_str()) p.created_at = ts;
  }
  return p;
}

std::vector<Profile> ProfileStore::list() const {
  std::vector<Profile> out;
  std::error_code ec;
  const auto base = home_.configs_dir();
  if (!fs::exists(base, ec)) return out;

  for (auto &e : fs::directory_iterator(base, ec)) {
    if (e.path().extension() != kExt) continue;
    if (!valid_profile_name(e.path().stem().string())) continue;
    if (auto p = load(e.path())) out.push_back(std::move(*p));
  }
  if (ec) throw IOError("list " + base.string() + ": " + ec.message());

  auto cur = current();
  for (auto &p : out) p.active = cur && *cur == p.name;
  std::sort(out.begin(), out.end(), [](const Profile &a, const Profile &b) { return a.name < b.name; });
  return out;
}

std::optional<Profile> ProfileStore::find(const std::string &name) const {
  if (!valid_profile_name(name)) return std::nullopt;
  auto p = load(home_.configs_dir() / (name + kExt));
  if (p) {
    auto cur = current_.read();
    p->active = cur && *cur == name;
  }
  return p;
}

void ProfileStore::write(const std::string &name, const std::string &content) const {
  const auto file = path_for(name);
  std::error_code ec;
  const bool created = !fs::exists(file, ec);
  io::atomic_write(file, content);
  if (created) io::atomic_write(created_marker(file), std::to_string(now_seconds()) + "\n");
  spdlog::info("[profile={}] saved", name);
}

void ProfileStore::remove(const std::string &name) const {
  if (!find(name)) throw NotFoundError("profile " + name + " does not exist");
  const auto file = path_for(name);
  if (::unlink(file.c_str()) != 0 && errno != ENOENT)
    throw IOError("remove " + file.string() + ": " + std::strerror(errno));
  if (::unlink(created_marker(file).c_str()) != 0 && errno != ENOENT)
    spdlog::warn("[profile={}] creation marker left behind: {}", name, std::strerror(errno));
  if (auto cur = current_.read(); cur && *cur == name) {
    current_.clear();
    spdlog::info("[profile={}] cleared current pointer", name);
  }
}

std::optional<std::string> ProfileStore::current() const {
  auto cur = current_.read();
  if (!cur) return std::nullopt;
  if (!valid_profile_name(*cur) || !load(home_.configs_dir() / (*cur + kExt))) {
    spdlog::warn("current profile '{}' does not exist; treating as unset", *cur);
    return std::nullopt;
  }
  return cur;
}

void ProfileStore::set_current(const std::string &name) const {
  if (!find(name)) throw NotFoundError("profile " + name + " does not exist");
  current_.write(name);
}

void ProfileStore::clear_current() const { current_.clear(); }

} // namespace mihomoctl
