#include <catch2/catch_all.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/proxy_manager.hpp>

#include "support/fake_controller.hpp"

#include <algorithm>

using namespace mihomoctl;
using namespace std::chrono_literals;

static const char *kGroups = R"({"proxies":{
  "DIRECT":{"name":"DIRECT","type":"Direct","history":[]},
  "auto":{"name":"auto","type":"Selector","now":"slow","all":["slow","fast","dead"],"history":[]},
  "slow":{"name":"slow","type":"Shadowsocks","history":[{"time":"2026-01-01T00:00:00Z","delay":300}]},
  "fast":{"name":"fast","type":"Trojan","history":[{"time":"2026-01-01T00:00:00Z","delay":40}]},
  "dead":{"name":"dead","type":"Shadowsocks","history":[]}
}})";

static ControllerSettings short_timeout() {
  ControllerSettings c;
  c.timeout_ms = 2000;
  return c;
}

static int count_requests(const fake::Controller &ctl, const std::string &method, const std::string &target) {
  auto reqs = ctl.requests();
  return static_cast<int>(std::count_if(reqs.begin(), reqs.end(), [&](const http::Request &r) {
    return r.method == method && r.target.rfind(target, 0) == 0;
  }));
}

struct ProxyFixture {
  fake::Controller ctl;

  ProxyFixture() {
    ctl.route("GET", "/proxies", 200, kGroups);
    ctl.route("PUT", "/proxies/auto", 204, "");
    ctl.route("GET", "/proxies/slow/delay", 200, R"({"delay":310})", 300ms);
    ctl.route("GET", "/proxies/fast/delay", 200, R"({"delay":45})", 300ms);
    ctl.route("GET", "/proxies/dead/delay", 504, R"({"message":"Timeout"})", 300ms);
  }

  ProxyManager manager() { return ProxyManager(ControlPlaneClient(ctl.url(), "", short_timeout())); }
};

TEST_CASE("delay tests run concurrently and keep input order") {
  ProxyFixture fx;
  auto pm = fx.manager();

  const auto t0 = std::chrono::steady_clock::now();
  auto results = pm.test_delays({"slow", "fast", "dead"}, "http://www.gstatic.com/generate_204", 1000);
  const auto took = std::chrono::steady_clock::now() - t0;

  // three 300ms answers one after the other would take 900ms
  CHECK(took < 700ms);
  REQUIRE(results.size() == 3);
  CHECK(results[0].proxy == "slow");
  CHECK(results[0].delay == 310);
  CHECK(results[1].proxy == "fast");
  CHECK(results[1].delay == 45);
  CHECK(results[2].proxy == "dead");
  CHECK_FALSE(results[2].delay);
  CHECK_FALSE(results[2].error.empty());
  CHECK(count_requests(fx.ctl, "GET", "/proxies/") == 3);

  SECTION("one at a time when parallel is 1") {
    const auto t1 = std::chrono::steady_clock::now();
    pm.test_delays({"slow", "fast"}, "http://www.gstatic.com/generate_204", 1000, 1);
    CHECK(std::chrono::steady_clock::now() - t1 >= 600ms);
  }
}

TEST_CASE("auth failures during delay tests are not swallowed") {
  fake::Controller ctl("s3cret");
  ProxyManager pm(ControlPlaneClient(ctl.url(), "wrong", short_timeout()));
  CHECK_THROWS_AS(pm.test_delays({"slow", "fast"}, "http://x/", 500), AuthError);
}

TEST_CASE("select_fastest switches the group to its quickest member") {
  ProxyFixture fx;
  auto pm = fx.manager();

  auto best = pm.select_fastest("auto", "http://www.gstatic.com/generate_204", 1000);
  CHECK(best.first == "fast");
  CHECK(best.second == 45);

  auto reqs = fx.ctl.requests();
  auto put = std::find_if(reqs.begin(), reqs.end(), [](const http::Request &r) { return r.method == "PUT"; });
  REQUIRE(put != reqs.end());
  CHECK(put->target == "/proxies/auto");
  CHECK_THAT(put->body, Catch::Matchers::ContainsSubstring(R"("name":"fast")"));

  auto g = pm.group("auto");
  REQUIRE(g);
  CHECK(g->now == "fast");

  SECTION("no responding member") {
    fx.ctl.route("GET", "/proxies/slow/delay", 504, "{}");
    fx.ctl.route("GET", "/proxies/fast/delay", 504, "{}");
    CHECK_THROWS_AS(pm.select_fastest("auto", "http://x/", 500), NetworkError);
  }
  SECTION("unknown group") {
    CHECK_THROWS_AS(pm.select_fastest("nope", "http://x/", 500), NotFoundError);
  }
}

TEST_CASE("switching checks group membership first") {
  ProxyFixture fx;
  auto pm = fx.manager();

  CHECK_THROWS_AS(pm.switch_proxy("missing", "fast"), NotFoundError);
  CHECK_THROWS_AS(pm.switch_proxy("auto", "DIRECT"), ValidationError);
  CHECK(count_requests(fx.ctl, "PUT", "/proxies/") == 0);

  pm.switch_proxy("auto", "dead");
  CHECK(count_requests(fx.ctl, "PUT", "/proxies/auto") == 1);
}

TEST_CASE("proxy listings are cached for the ttl") {
  ProxyFixture fx;
  auto pm = fx.manager();

  CHECK(pm.proxies().size() == 5);
  CHECK(pm.groups().size() == 1);
  pm.stats();
  CHECK(count_requests(fx.ctl, "GET", "/proxies") == 1);

  pm.refresh();
  CHECK(count_requests(fx.ctl, "GET", "/proxies") == 2);

  pm.set_cache_ttl(0s);
  pm.groups();
  pm.groups();
  CHECK(count_requests(fx.ctl, "GET", "/proxies") == 4);
}

TEST_CASE("stats count proxies by type") {
  ProxyFixture fx;
  auto s = fx.manager().stats();
  CHECK(s.total_proxies == 5);
  CHECK(s.total_groups == 1);
  CHECK(s.proxies_with_delay == 2);
  CHECK(s.type_counts.at("Shadowsocks") == 2);
  CHECK(s.type_counts.at("Selector") == 1);
  CHECK(s.type_counts.at("Direct") == 1);
}
