#include <mihomoctl/error.hpp>
#include <mihomoctl/monitor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fmt/format.h>

using namespace std::chrono_literals;

namespace mihomoctl {

const char *event_name(MonitorEventKind k) {
  switch (k) {
  case MonitorEventKind::Healthy: return "healthy";
  case MonitorEventKind::Unhealthy: return "unhealthy";
  case MonitorEventKind::Stopped: return "stopped";
  case MonitorEventKind::Crashed: return "crashed";
  case MonitorEventKind::Waiting: return "waiting";
  case MonitorEventKind::Restarted: return "restarted";
  case MonitorEventKind::RestartFailed: return "restart-failed";
  case MonitorEventKind::Exhausted: return "exhausted";
  }
  return "unknown";
}

Monitor::Monitor(ServiceManager &service, MonitorSettings settings,
                 std::shared_ptr<const ControlPlaneClient> client, MonitorCallback on_event)
    : service_(service), settings_(settings), client_(std::move(client)), on_event_(std::move(on_event)) {}

std::chrono::milliseconds Monitor::backoff_delay(const MonitorSettings &s, int attempt) {
  std::int64_t d = std::max(0, s.base_delay_ms);
  for (int i = 1; i < attempt && d < s.max_delay_ms; ++i) d *= 2;
  return std::chrono::milliseconds(std::min<std::int64_t>(d, s.max_delay_ms));
}

MonitorEvent Monitor::emit(MonitorEventKind kind, ServiceState state, std::string message) {
  MonitorEvent ev{kind, std::move(state), attempts_, std::move(message)};
  if (on_event_) on_event_(ev);
  return ev;
}

MonitorEvent Monitor::try_restart(ServiceState state) {
  if (attempts_ >= settings_.max_attempts) {
    auto msg = fmt::format("restart attempts exhausted ({}/{})", attempts_, settings_.max_attempts);
    spdlog::error("[monitor] {}", msg);
    emit(MonitorEventKind::Exhausted, state, msg);
    throw ProcessError(msg);
  }
  if (clock::now() < next_attempt_at_) return emit(MonitorEventKind::Waiting, std::move(state));

  ++attempts_;
  spdlog::info("[monitor] restart attempt {}/{}", attempts_, settings_.max_attempts);
  try {
    auto st = service_.start();
    restart_pending_ = false;
    healthy_since_ = clock::now();
    return emit(MonitorEventKind::Restarted, std::move(st));
  } catch (const Error &e) {
    spdlog::warn("[monitor] restart attempt {} failed: {}", attempts_, e.what());
    next_attempt_at_ = clock::now() + backoff_delay(settings_, attempts_ + 1);
    return emit(MonitorEventKind::RestartFailed, std::move(state), e.what());
  }
}

MonitorEvent Monitor::tick() {
  auto st = service_.status();

  if (st.kind == ServiceStateKind::Crashed) {
    spdlog::warn("[monitor] service crashed (pid {})", st.pid());
    healthy_since_.reset();
    if (settings_.restart == RestartMode::Never) return emit(MonitorEventKind::Crashed, st);
    if (!restart_pending_) {
      restart_pending_ = true;
      next_attempt_at_ = clock::now() + backoff_delay(settings_, attempts_ + 1);
    }
    emit(MonitorEventKind::Crashed, st);
    return try_restart(std::move(st));
  }

  if (restart_pending_) return try_restart(std::move(st));

  if (!st.is_running()) {
    healthy_since_.reset();
    return emit(MonitorEventKind::Stopped, std::move(st));
  }

  const auto now = clock::now();
  if (client_ && !client_->healthy()) {
    spdlog::warn("[monitor] health probe failed (pid {})", st.pid());
    healthy_since_ = now;
    return emit(MonitorEventKind::Unhealthy, std::move(st));
  }
  if (!healthy_since_) healthy_since_ = now;
  if (attempts_ > 0 && now - *healthy_since_ >= std::chrono::seconds(settings_.healthy_reset_sec)) {
    spdlog::info("[monitor] healthy for {}s; restart counter reset", settings_.healthy_reset_sec);
    attempts_ = 0;
  }
  return emit(MonitorEventKind::Healthy, std::move(st));
}

void Monitor::run() {
  spdlog::info("[monitor] started (interval={}s)", settings_.interval_sec);
  while (!stop_.load()) {
    tick();
    auto wait = std::chrono::duration_cast<clock::duration>(std::chrono::seconds(std::max(1, settings_.interval_sec)));
    if (restart_pending_) {
      auto until = next_attempt_at_ - clock::now();
      if (until < wait) wait = std::max<clock::duration>(until, 10ms);
    }
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, wait, [this] { return stop_.load(); });
  }
  spdlog::info("[monitor] stopped");
}

void Monitor::request_stop() {
  stop_.store(true);
  std::lock_guard<std::mutex> lk(mu_);
  cv_.notify_all();
}

} // namespace mihomoctl
