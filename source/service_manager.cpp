#include <mihomoctl/error.hpp>
#include <mihomoctl/process.hpp>
#include <mihomoctl/service_manager.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace mihomoctl {

ServiceManager::ServiceManager(HomeContext home, fs::path binary, fs::path config,
                               ServiceSettings settings)
    : home_(home), binary_(std::move(binary)), config_(std::move(config)),
      supervisor_(std::move(home), settings) {}

ServiceState ServiceManager::start() {
  try {
    return supervisor_.start(binary_, config_);
  } catch (const Error &e) {
    Error::wrap(e, "start " + binary_.string());
  }
}

ServiceState ServiceManager::stop() {
  try {
    return supervisor_.stop();
  } catch (const Error &e) {
    Error::wrap(e, "stop");
  }
}

ServiceState ServiceManager::restart() {
  try {
    return supervisor_.restart(binary_, config_);
  } catch (const Error &e) {
    Error::wrap(e, "restart " + binary_.string());
  }
}

ServiceState ServiceManager::status() { return supervisor_.status(); }

ServiceState ServiceManager::reconcile() { return supervisor_.reconcile(); }

void ServiceManager::rebind(fs::path binary, fs::path config) {
  binary_ = std::move(binary);
  config_ = std::move(config);
  spdlog::debug("[service] bound to {} / {}", binary_.string(), config_.string());
}

std::optional<PidRecord> ServiceManager::running_record(const HomeContext &home) {
  auto rec = PidStore::read(home.pid_file());
  if (!rec || rec->pid <= 0) return std::nullopt;
  if (!ProcessRunner::owned(rec->pid, rec->binary)) return std::nullopt;
  return rec;
}

} // namespace mihomoctl
