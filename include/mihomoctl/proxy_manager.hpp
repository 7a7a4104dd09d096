#pragma once
#include "control_client.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mihomoctl {

struct DelayResult {
  std::string proxy;
  std::optional<int> delay; // ms; unset when the test failed
  std::string error;
};

struct ProxyStats {
  std::size_t total_proxies = 0;
  std::size_t total_groups = 0;
  std::size_t proxies_with_delay = 0;
  std::map<std::string, std::size_t> type_counts;
};

// Proxy and group view of a controller, cached for `ttl`, plus the
// operations that span several proxies.
class ProxyManager {
public:
  explicit ProxyManager(ControlPlaneClient client, std::chrono::seconds ttl = std::chrono::seconds(30));

  void set_cache_ttl(std::chrono::seconds ttl) { ttl_ = ttl; }
  void refresh();

  const std::vector<ProxyInfo> &proxies();
  const std::vector<ProxyGroup> &groups();
  std::optional<ProxyGroup> group(const std::string &name);

  // NotFoundError for an unknown group, ValidationError when `proxy` is not
  // one of its members.
  void switch_proxy(const std::string &group, const std::string &proxy);

  // Runs the delay tests concurrently, at most `parallel` at a time. One
  // result per name, in input order. AuthError is rethrown; every other
  // failure is recorded in its result.
  std::vector<DelayResult> test_delays(const std::vector<std::string> &names, const std::string &url,
                                       int timeout_ms, int parallel = 16) const;

  // Tests every member of `group` and switches it to the fastest one
  // (first in member order on ties). NetworkError when none responded.
  std::pair<std::string, int> select_fastest(const std::string &group, const std::string &url,
                                             int timeout_ms);

  ProxyStats stats();

private:
  void ensure_fresh();

  ControlPlaneClient client_;
  std::chrono::seconds ttl_;
  std::optional<std::chrono::steady_clock::time_point> fetched_at_;
  std::vector<ProxyInfo> proxies_;
  std::vector<ProxyGroup> groups_;
};

} // namespace mihomoctl
