#pragma once
#include "home.hpp"
#include "settings.hpp"
#include "state.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace mihomoctl {

enum class ServiceStateKind { Stopped, Starting, Running, Stopping, Crashed };

const char *state_name(ServiceStateKind k);

struct ServiceState {
  ServiceStateKind kind = ServiceStateKind::Stopped;
  // Running: the live record. Crashed: the stale record that was cleared.
  std::optional<PidRecord> record;
  // restart(): the crashed instance found in place of a running one.
  std::optional<PidRecord> replaced_crash;

  int pid() const { return record ? record->pid : -1; }
  bool is_running() const { return kind == ServiceStateKind::Running; }

  static ServiceState stopped() { return {}; }
  static ServiceState running(PidRecord r) { return {ServiceStateKind::Running, std::move(r), std::nullopt}; }
  static ServiceState crashed(PidRecord r) { return {ServiceStateKind::Crashed, std::move(r), std::nullopt}; }
};

// State machine for the single supervised instance. The pid file is the
// durable truth; every public call reconciles against it first.
class ProcessSupervisor {
public:
  explicit ProcessSupervisor(HomeContext home, ServiceSettings settings = {});

  ServiceState start(const std::filesystem::path &binary, const std::filesystem::path &config);
  // Reports Crashed, not Stopped, when the process had already died.
  ServiceState stop();
  ServiceState restart(const std::filesystem::path &binary, const std::filesystem::path &config);
  ServiceState status();

  // Clears a record whose process is gone or is not ours and reports
  // Crashed for it, once.
  ServiceState reconcile();

  // Last observed state, without probing.
  ServiceState state() const;

private:
  ServiceState reconcile_locked();
  ServiceState start_locked(const std::filesystem::path &binary, const std::filesystem::path &config);
  ServiceState stop_locked();

  HomeContext home_;
  ServiceSettings settings_;
  mutable std::mutex mu_;
  ServiceState state_;
};

} // namespace mihomoctl
