#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/state.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mihomoctl {

std::optional<PidRecord> PidStore::read(const fs::path &f) {
  auto content = io::read_file(f);
  if (!content) return std::nullopt;

  PidRecord r;
  std::istringstream in(*content);
  std::string line;
  if (std::getline(in, line)) {
    char *end = nullptr;
    long p = std::strtol(line.c_str(), &end, 10);
    if (end != line.c_str() && p > 0) r.pid = static_cast<int>(p);
  }
  while (std::getline(in, line)) {
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    auto k = line.substr(0, eq);
    auto v = line.substr(eq + 1);
    if (k == "started_at") r.started_at = std::strtoll(v.c_str(), nullptr, 10);
    else if (k == "binary") r.binary = v;
    else if (k == "config") r.config = v;
  }
  if (r.pid <= 0) spdlog::warn("[service] malformed pid file {}", f.string());
  return r;
}

void PidStore::write(const fs::path &f, const PidRecord &r) {
  std::ostringstream o;
  o << r.pid << "\n"
    << "started_at=" << r.started_at << "\n"
    << "binary=" << r.binary.string() << "\n"
    << "config=" << r.config.string() << "\n";
  io::atomic_write(f, o.str());
}

void PidStore::remove(const fs::path &f) {
  if (::unlink(f.c_str()) != 0 && errno != ENOENT)
    throw IOError("remove " + f.string() + ": " + std::strerror(errno));
}

} // namespace mihomoctl
