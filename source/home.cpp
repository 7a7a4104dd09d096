#include <mihomoctl/error.hpp>
#include <mihomoctl/home.hpp>
#include <mihomoctl/io.hpp>

#include <cstdlib>

namespace fs = std::filesystem;

namespace mihomoctl {

HomeContext::HomeContext(fs::path root) : root_(std::move(root)) {}

HomeContext HomeContext::resolve(const std::optional<fs::path> &override_dir) {
  if (override_dir && !override_dir->empty())
    return HomeContext(fs::absolute(*override_dir));

  if (const char *env = std::getenv("MIHOMO_HOME"); env && *env)
    return HomeContext(fs::absolute(env));

  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return HomeContext(fs::path(xdg) / "mihomoctl");

  const char *home = std::getenv("HOME");
  if (!home || !*home)
    throw IOError("cannot determine home directory: set MIHOMO_HOME or HOME");
  return HomeContext(fs::path(home) / ".config" / "mihomoctl");
}

void HomeContext::ensure_layout() const {
  io::ensure_dir(root_);
  io::ensure_dir(versions_dir());
  io::ensure_dir(configs_dir());
  io::ensure_dir(staging_dir());
  io::ensure_dir(logs_dir());
}

} // namespace mihomoctl
