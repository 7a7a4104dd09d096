#pragma once
#include "control_client.hpp"
#include "service_manager.hpp"
#include "settings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mihomoctl {

enum class MonitorEventKind {
  Healthy,       // running, health probe passed (or no client)
  Unhealthy,     // running, health probe failed
  Stopped,       // not running and no restart pending
  Crashed,       // reconcile reported a crash
  Waiting,       // restart pending, backoff not elapsed
  Restarted,
  RestartFailed,
  Exhausted,
};

const char *event_name(MonitorEventKind k);

struct MonitorEvent {
  MonitorEventKind kind = MonitorEventKind::Stopped;
  ServiceState state;
  int attempts = 0; // restart attempts since the last healthy reset
  std::string message;
};

using MonitorCallback = std::function<void(const MonitorEvent &)>;

class Monitor {
public:
  // `client` is optional; without it Running counts as healthy.
  Monitor(ServiceManager &service, MonitorSettings settings,
          std::shared_ptr<const ControlPlaneClient> client = nullptr, MonitorCallback on_event = {});

  // One observation. Throws ProcessError once restart attempts are exhausted.
  MonitorEvent tick();

  // Ticks every interval_sec until request_stop(). Propagates exhaustion.
  void run();
  void request_stop();

  int attempts() const { return attempts_; }

  // base_delay * 2^(attempt-1), capped at max_delay.
  static std::chrono::milliseconds backoff_delay(const MonitorSettings &s, int attempt);

private:
  using clock = std::chrono::steady_clock;

  MonitorEvent emit(MonitorEventKind kind, ServiceState state, std::string message = {});
  MonitorEvent try_restart(ServiceState state);

  ServiceManager &service_;
  MonitorSettings settings_;
  std::shared_ptr<const ControlPlaneClient> client_;
  MonitorCallback on_event_;

  int attempts_ = 0;
  bool restart_pending_ = false;
  clock::time_point next_attempt_at_{};
  std::optional<clock::time_point> healthy_since_;

  std::atomic<bool> stop_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace mihomoctl
