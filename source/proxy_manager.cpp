#include <mihomoctl/error.hpp>
#include <mihomoctl/proxy_manager.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

using namespace std::chrono;

namespace mihomoctl {

ProxyManager::ProxyManager(ControlPlaneClient client, seconds ttl)
    : client_(std::move(client)), ttl_(ttl) {}

void ProxyManager::refresh() {
  auto all = client_.proxies();
  std::vector<ProxyGroup> groups;
  for (auto &p : all)
    if (p.is_group()) groups.push_back(ProxyGroup{p.name, p.type, p.now.value_or(""), p.all});
  proxies_ = std::move(all);
  groups_ = std::move(groups);
  fetched_at_ = steady_clock::now();
  spdlog::debug("[proxy] cache refreshed: {} proxies, {} groups", proxies_.size(), groups_.size());
}

void ProxyManager::ensure_fresh() {
  if (!fetched_at_ || steady_clock::now() - *fetched_at_ >= ttl_) refresh();
}

const std::vector<ProxyInfo> &ProxyManager::proxies() {
  ensure_fresh();
  return proxies_;
}

const std::vector<ProxyGroup> &ProxyManager::groups() {
  ensure_fresh();
  return groups_;
}

std::optional<ProxyGroup> ProxyManager::group(const std::string &name) {
  for (auto &g : groups())
    if (g.name == name) return g;
  return std::nullopt;
}

void ProxyManager::switch_proxy(const std::string &group_name, const std::string &proxy) {
  ensure_fresh();
  auto g = std::find_if(groups_.begin(), groups_.end(),
                        [&](const ProxyGroup &x) { return x.name == group_name; });
  if (g == groups_.end()) throw NotFoundError("proxy group " + group_name + " does not exist");
  if (std::find(g->all.begin(), g->all.end(), proxy) == g->all.end())
    throw ValidationError("proxy " + proxy + " is not a member of " + group_name);
  client_.switch_proxy(group_name, proxy);
  g->now = proxy;
}

std::vector<DelayResult> ProxyManager::test_delays(const std::vector<std::string> &names,
                                                   const std::string &url, int timeout_ms,
                                                   int parallel) const {
  std::vector<DelayResult> results(names.size());
  std::vector<std::exception_ptr> auth(names.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&] {
    for (std::size_t i; (i = next.fetch_add(1)) < names.size();) {
      results[i].proxy = names[i];
      try {
        results[i].delay = client_.test_delay(names[i], url, timeout_ms);
      } catch (const AuthError &) {
        auth[i] = std::current_exception();
      } catch (const std::exception &e) {
        results[i].error = e.what();
      }
    }
  };

  const auto n = std::min<std::size_t>(names.size(), static_cast<std::size_t>(std::max(parallel, 1)));
  std::vector<std::thread> pool;
  for (std::size_t i = 0; i < n; ++i) pool.emplace_back(worker);
  for (auto &t : pool) t.join();

  for (auto &e : auth)
    if (e) std::rethrow_exception(e);
  return results;
}

std::pair<std::string, int> ProxyManager::select_fastest(const std::string &group_name,
                                                         const std::string &url, int timeout_ms) {
  auto g = group(group_name);
  if (!g) throw NotFoundError("proxy group " + group_name + " does not exist");
  if (g->all.empty()) throw ValidationError("proxy group " + group_name + " is empty");

  spdlog::info("[proxy] testing {} members of {}", g->all.size(), group_name);
  std::optional<DelayResult> best;
  for (auto &r : test_delays(g->all, url, timeout_ms)) {
    if (!r.delay) {
      spdlog::warn("[proxy] {} failed: {}", r.proxy, r.error);
      continue;
    }
    if (!best || *r.delay < *best->delay) best = r;
  }
  if (!best) throw NetworkError("no member of " + group_name + " responded");

  switch_proxy(group_name, best->proxy);
  spdlog::info("[proxy] {} selected {} ({} ms)", group_name, best->proxy, *best->delay);
  return {best->proxy, *best->delay};
}

ProxyStats ProxyManager::stats() {
  ensure_fresh();
  ProxyStats s;
  s.total_proxies = proxies_.size();
  s.total_groups = groups_.size();
  for (auto &p : proxies_) {
    ++s.type_counts[p.type];
    if (!p.history.empty()) ++s.proxies_with_delay;
  }
  return s;
}

} // namespace mihomoctl
