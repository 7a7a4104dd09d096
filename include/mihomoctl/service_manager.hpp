#pragma once
#include "home.hpp"
#include "settings.hpp"
#include "supervisor.hpp"

#include <filesystem>
#include <optional>

namespace mihomoctl {

// A ProcessSupervisor bound to one resolved binary and config. Switching the
// default version or current profile does not touch a running instance; a new
// binding takes effect on the next restart().
class ServiceManager {
public:
  ServiceManager(HomeContext home, std::filesystem::path binary, std::filesystem::path config,
                 ServiceSettings settings = {});

  ServiceState start();
  ServiceState stop();
  ServiceState restart();
  ServiceState status();
  ServiceState reconcile();

  void rebind(std::filesystem::path binary, std::filesystem::path config);
  const std::filesystem::path &binary() const { return binary_; }
  const std::filesystem::path &config() const { return config_; }

  // Read-only probe: the pid record if it names a live instance. Never
  // modifies the pid file.
  static std::optional<PidRecord> running_record(const HomeContext &home);

private:
  HomeContext home_;
  std::filesystem::path binary_;
  std::filesystem::path config_;
  ProcessSupervisor supervisor_;
};

} // namespace mihomoctl
