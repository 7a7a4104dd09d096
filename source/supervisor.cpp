#include <mihomoctl/error.hpp>
#include <mihomoctl/process.hpp>
#include <mihomoctl/supervisor.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace mihomoctl {

const char *state_name(ServiceStateKind k) {
  switch (k) {
    case ServiceStateKind::Stopped: return "stopped";
    case ServiceStateKind::Starting: return "starting";
    case ServiceStateKind::Running: return "running";
    case ServiceStateKind::Stopping: return "stopping";
    case ServiceStateKind::Crashed: return "crashed";
  }
  return "unknown";
}

ProcessSupervisor::ProcessSupervisor(HomeContext home, ServiceSettings settings)
    : home_(std::move(home)), settings_(settings) {}

ServiceState ProcessSupervisor::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

ServiceState ProcessSupervisor::reconcile() {
  std::lock_guard<std::mutex> lk(mu_);
  return reconcile_locked();
}

ServiceState ProcessSupervisor::status() {
  std::lock_guard<std::mutex> lk(mu_);
  return reconcile_locked();
}

ServiceState ProcessSupervisor::start(const fs::path &binary, const fs::path &config) {
  std::lock_guard<std::mutex> lk(mu_);
  return start_locked(binary, config);
}

ServiceState ProcessSupervisor::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  return stop_locked();
}

ServiceState ProcessSupervisor::restart(const fs::path &binary, const fs::path &config) {
  std::lock_guard<std::mutex> lk(mu_);
  auto prev = stop_locked();
  auto st = start_locked(binary, config);
  if (prev.kind == ServiceStateKind::Crashed) {
    spdlog::warn("[service] restarted after pid={} crashed", prev.pid());
    st.replaced_crash = prev.record;
  }
  return st;
}

ServiceState ProcessSupervisor::reconcile_locked() {
  const auto pidf = home_.pid_file();
  auto rec = PidStore::read(pidf);
  if (!rec) {
    state_ = ServiceState::stopped();
    return state_;
  }
  if (rec->pid > 0 && ProcessRunner::owned(rec->pid, rec->binary)) {
    state_ = ServiceState::running(*rec);
    return state_;
  }

  if (rec->pid > 0 && ProcessRunner::alive(rec->pid))
    spdlog::warn("[service] pid={} is alive but is not {}; clearing stale record", rec->pid,
                 rec->binary.string());
  else
    spdlog::warn("[service] pid={} is gone; clearing stale record", rec->pid);
  PidStore::remove(pidf);
  state_ = ServiceState::crashed(*rec);
  return state_;
}

ServiceState ProcessSupervisor::start_locked(const fs::path &binary_in, const fs::path &config_in) {
  auto cur = reconcile_locked();
  if (cur.is_running()) {
    spdlog::warn("[service] already running pid={}", cur.pid());
    return cur;
  }

  const auto binary = fs::absolute(binary_in);
  const auto config = fs::absolute(config_in);
  std::error_code ec;
  if (!fs::is_regular_file(binary, ec)) throw NotFoundError("binary not found: " + binary.string());
  if (!fs::is_regular_file(config, ec)) throw NotFoundError("config not found: " + config.string());

  state_ = ServiceState{ServiceStateKind::Starting, std::nullopt};
  SpawnSpec spec{binary, config, home_.logs_dir(),
                 static_cast<std::uintmax_t>(settings_.log_max_mb) * 1024 * 1024};
  int pid = -1;
  try {
    pid = ProcessRunner::spawn(spec);
  } catch (const Error &) {
    state_ = ServiceState::stopped();
    throw;
  }

  PidRecord rec;
  rec.pid = pid;
  rec.started_at = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  rec.binary = binary;
  rec.config = config;
  try {
    PidStore::write(home_.pid_file(), rec);
  } catch (const Error &) {
    if (!ProcessRunner::terminate(pid, 1s, 1s))
      spdlog::error("[service] pid={} left running without a pid file", pid);
    state_ = ServiceState::stopped();
    throw;
  }

  const auto deadline = steady_clock::now() + milliseconds(settings_.probe_ms);
  while (steady_clock::now() < deadline) {
    if (auto code = ProcessRunner::reap(pid)) {
      PidStore::remove(home_.pid_file());
      state_ = ServiceState::stopped();
      throw ProcessError(fmt::format("mihomo exited during startup with code {}; see {}", *code,
                                     (home_.logs_dir() / "mihomo.err").string()));
    }
    std::this_thread::sleep_for(20ms);
  }
  if (!ProcessRunner::alive(pid)) {
    PidStore::remove(home_.pid_file());
    state_ = ServiceState::stopped();
    throw ProcessError("mihomo died during startup; see " + (home_.logs_dir() / "mihomo.err").string());
  }

  state_ = ServiceState::running(rec);
  spdlog::info("[service] started pid={} binary={} config={}", pid, binary.string(), config.string());
  return state_;
}

ServiceState ProcessSupervisor::stop_locked() {
  auto cur = reconcile_locked();
  if (cur.kind == ServiceStateKind::Crashed) {
    spdlog::warn("[service] pid={} had already exited; nothing to stop", cur.pid());
    return cur;
  }
  if (!cur.is_running()) {
    spdlog::info("[service] not running");
    state_ = ServiceState::stopped();
    return state_;
  }

  const int pid = cur.pid();
  state_ = ServiceState{ServiceStateKind::Stopping, cur.record};
  bool gone = ProcessRunner::terminate(pid, seconds(settings_.stop_timeout_sec), 2s);
  if (!gone) {
    state_ = cur;
    throw ProcessError(fmt::format("pid {} did not exit after SIGKILL", pid));
  }
  PidStore::remove(home_.pid_file());
  state_ = ServiceState::stopped();
  spdlog::info("[service] stopped pid={}", pid);
  return state_;
}

} // namespace mihomoctl
