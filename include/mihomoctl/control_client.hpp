#pragma once
#include "settings.hpp"
#include "subscription.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

// Client of a running instance's external controller (REST + WebSocket).
class ControlPlaneClient {
public:
  explicit ControlPlaneClient(std::string base_url, std::string secret = {},
                              ControllerSettings controller = {}, StreamSettings stream = {});

  const std::string &base_url() const { return base_url_; }

  ControllerVersion version() const;
  std::vector<ProxyInfo> proxies() const;
  ProxyInfo proxy(const std::string &name) const;
  std::vector<ProxyGroup> proxy_groups() const;
  void switch_proxy(const std::string &group, const std::string &proxy) const;
  // Delay in ms as measured by the instance.
  int test_delay(const std::string &proxy, const std::string &url, int timeout_ms) const;
  ConnectionsSnapshot connections() const;
  void close_connection(const std::string &id) const;
  void close_all_connections() const;
  // Reloads from `path`, or the instance's own config file when unset.
  void reload_config(const std::optional<std::string> &path = std::nullopt) const;
  MemorySample memory() const;
  // Never throws.
  bool healthy() const;

  Subscription<LogEntry> subscribe_logs(LogLevel min_level = LogLevel::Info) const;
  Subscription<TrafficSample> subscribe_traffic() const;
  Subscription<MemorySample> subscribe_memory() const;

  // Stream connections currently held open by subscription tasks.
  int open_streams() const { return open_streams_->load(); }

private:
  Json::Value call(const std::string &method, const std::string &target,
                      const std::string &body = {}, int timeout_ms = 0) const;
  std::string ws_url(const std::string &target) const;

  std::string base_url_;
  std::string secret_;
  ControllerSettings controller_;
  StreamSettings stream_;
  std::shared_ptr<std::atomic<int>> open_streams_;
};

} // namespace mihomoctl
