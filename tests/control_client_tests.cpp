#include <catch2/catch_all.hpp>
#include <mihomoctl/control_client.hpp>
#include <mihomoctl/error.hpp>

#include "support/fake_controller.hpp"
#include "support/test_util.hpp"

using namespace mihomoctl;
using namespace testutil;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

static const char *kProxies = R"({"proxies":{
  "DIRECT":{"name":"DIRECT","type":"Direct","udp":true,"history":[]},
  "GLOBAL":{"name":"GLOBAL","type":"Selector","now":"node-a","all":["DIRECT","node-a"],"history":[]},
  "node-a":{"name":"node-a","type":"Shadowsocks","history":[{"time":"2026-01-01T00:00:00Z","delay":120},{"time":"2026-01-01T00:01:00Z","delay":87}]}
}})";

static StreamSettings fast_streams() {
  StreamSettings s;
  s.reconnect_attempts = 2;
  s.reconnect_base_ms = 20;
  s.reconnect_max_ms = 50;
  s.poll_ms = 50;
  return s;
}

static ControllerSettings short_timeout() {
  ControllerSettings c;
  c.timeout_ms = 2000;
  return c;
}

TEST_CASE("rest calls decode controller payloads") {
  fake::Controller ctl("s3cret");
  ctl.route("GET", "/version", 200, R"({"version":"v1.18.0","meta":true})");
  ctl.route("GET", "/proxies", 200, kProxies);
  ctl.route("GET", "/proxies/node-a", 200,
            R"({"name":"node-a","type":"Shadowsocks","history":[{"time":"t","delay":87}]})");
  ctl.route("PUT", "/proxies/GLOBAL", 204, "");
  ctl.route("GET", "/proxies/node-a/delay", 200, R"({"delay":42})");
  ctl.route("GET", "/connections", 200, R"({"downloadTotal":2048,"uploadTotal":1024,"connections":[
    {"id":"c1","metadata":{"network":"tcp","host":"example.com","destinationPort":"443"},
     "upload":10,"download":20,"chains":["node-a","GLOBAL"],"rule":"MATCH"}]})");
  ctl.route("DELETE", "/connections/c1", 204, "");
  ctl.route("PUT", "/configs", 204, "");

  ControlPlaneClient client(ctl.url(), "s3cret", short_timeout(), fast_streams());

  auto v = client.version();
  CHECK(v.version == "v1.18.0");
  CHECK(v.meta);
  CHECK(client.healthy());

  auto proxies = client.proxies();
  REQUIRE(proxies.size() == 3);
  auto groups = client.proxy_groups();
  REQUIRE(groups.size() == 1);
  CHECK(groups[0].name == "GLOBAL");
  CHECK(groups[0].now == "node-a");
  CHECK(groups[0].all == std::vector<std::string>{"DIRECT", "node-a"});

  auto node = client.proxy("node-a");
  CHECK(node.type == "Shadowsocks");
  CHECK(node.last_delay() == 87);
  CHECK_FALSE(node.is_group());

  client.switch_proxy("GLOBAL", "DIRECT");
  CHECK(client.test_delay("node-a", "http://www.gstatic.com/generate_204", 3000) == 42);

  auto snap = client.connections();
  CHECK(snap.download_total == 2048);
  REQUIRE(snap.connections.size() == 1);
  CHECK(snap.connections[0].metadata.host == "example.com");
  CHECK(snap.connections[0].chains.size() == 2);
  client.close_connection("c1");
  client.reload_config();

  bool saw_switch = false, saw_delay_query = false;
  for (auto &req : ctl.requests()) {
    CHECK(req.headers.at("authorization") == "Bearer s3cret");
    if (req.method == "PUT" && req.target == "/proxies/GLOBAL") {
      saw_switch = true;
      auto body = parse_json(req.body);
      REQUIRE(body);
      CHECK((*body)["name"].asString() == "DIRECT");
    }
    if (req.target.rfind("/proxies/node-a/delay?", 0) == 0) {
      saw_delay_query = true;
      CHECK_THAT(req.target, ContainsSubstring("timeout=3000"));
      CHECK_THAT(req.target, ContainsSubstring("url=http%3A%2F%2Fwww.gstatic.com%2Fgenerate_204"));
    }
  }
  CHECK(saw_switch);
  CHECK(saw_delay_query);
}

TEST_CASE("controller status codes map to error kinds") {
  fake::Controller ctl("s3cret");
  ctl.route("GET", "/version", 200, R"({"version":"v1.18.0"})");
  ctl.route("PUT", "/proxies/GLOBAL", 400, R"({"message":"Selector update error: proxy not exist"})");
  ctl.route("GET", "/proxies", 500, "oops");
  ctl.route("GET", "/connections", 200, "not json");

  SECTION("wrong secret") {
    ControlPlaneClient client(ctl.url(), "wrong", short_timeout());
    CHECK_THROWS_AS(client.version(), AuthError);
    CHECK_FALSE(client.healthy());
  }
  SECTION("missing secret") {
    ControlPlaneClient client(ctl.url(), "", short_timeout());
    CHECK_THROWS_AS(client.version(), AuthError);
  }
  SECTION("errors from a good session") {
    ControlPlaneClient client(ctl.url(), "s3cret", short_timeout());
    CHECK_THROWS_AS(client.proxy("ghost"), NotFoundError);
    try {
      client.switch_proxy("GLOBAL", "ghost");
      FAIL("switch should be rejected");
    } catch (const ValidationError &e) {
      CHECK_THAT(std::string(e.what()), ContainsSubstring("proxy not exist"));
    }
    CHECK_THROWS_AS(client.proxies(), NetworkError);
    CHECK_THROWS_AS(client.connections(), ValidationError);
  }
}

TEST_CASE("an unreachable controller is a network error") {
  std::string url;
  {
    fake::Controller ctl;
    url = ctl.url();
  }
  ControlPlaneClient client(url, "", short_timeout(), fast_streams());
  CHECK_THROWS_AS(client.version(), NetworkError);
  CHECK_FALSE(client.healthy());

  auto sub = client.subscribe_traffic();
  CHECK_THROWS_AS(sub.recv(), NetworkError);
  CHECK_FALSE(sub.is_open());
}

TEST_CASE("closing a subscription releases its connection") {
  fake::Controller ctl;
  ctl.stream("/traffic", {R"({"up":100,"down":200})", R"({"up":300,"down":400})"}, 20ms);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());

  auto sub = client.subscribe_traffic();
  auto first = sub.recv();
  REQUIRE(first);
  CHECK((first->up == 100 || first->up == 300));
  CHECK(sub.is_open());
  CHECK(client.open_streams() == 1);
  REQUIRE(wait_until([&] { return ctl.live_streams() == 1; }, 1000ms));

  sub.close();
  CHECK(client.open_streams() == 0);
  CHECK(wait_until([&] { return ctl.live_streams() == 0; }, 1000ms));
  CHECK_FALSE(sub.is_open());
}

TEST_CASE("dropping the subscription object cancels it too") {
  fake::Controller ctl;
  ctl.stream("/memory", {R"({"inuse":1048576,"oslimit":0})"}, 20ms);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());
  {
    auto sub = client.subscribe_memory();
    auto m = sub.recv();
    REQUIRE(m);
    CHECK(m->inuse == 1048576);
  }
  CHECK(client.open_streams() == 0);
  CHECK(wait_until([&] { return ctl.live_streams() == 0; }, 1000ms));
}

TEST_CASE("streams reconnect after a dropped connection") {
  fake::Controller ctl;
  ctl.stream("/traffic", {R"({"up":1,"down":2})"}, 20ms);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());

  auto sub = client.subscribe_traffic();
  REQUIRE(sub.recv());
  ctl.drop_streams();
  REQUIRE(wait_until([&] { return ctl.accepted_streams() >= 2; }, 2000ms));
  auto again = sub.recv_for(1000ms);
  CHECK(again);
  CHECK(sub.is_open());
}

TEST_CASE("streams give up after the reconnect cap") {
  auto ctl = std::make_unique<fake::Controller>();
  ctl->stream("/traffic", {R"({"up":1,"down":2})"}, 20ms);
  ControlPlaneClient client(ctl->url(), "", short_timeout(), fast_streams());

  auto sub = client.subscribe_traffic();
  REQUIRE(sub.recv());
  ctl->stop();

  // drain whatever was queued before the controller went away
  bool failed = false;
  for (int i = 0; i < 20 && !failed; ++i) {
    try {
      sub.recv();
    } catch (const NetworkError &e) {
      failed = true;
      CHECK_THAT(std::string(e.what()), ContainsSubstring("reconnect attempts exhausted"));
    }
  }
  CHECK(failed);
  CHECK(client.open_streams() == 0);
}

TEST_CASE("stream handshake failures end the stream at once") {
  fake::Controller ctl("s3cret");
  ctl.stream("/traffic", {R"({"up":1,"down":2})"}, 20ms);

  SECTION("unauthorized") {
    ControlPlaneClient client(ctl.url(), "nope", short_timeout(), fast_streams());
    auto sub = client.subscribe_traffic();
    CHECK_THROWS_AS(sub.recv(), AuthError);
    CHECK_THROWS_AS(client.memory(), AuthError);
  }
  SECTION("unknown endpoint") {
    ControlPlaneClient client(ctl.url(), "s3cret", short_timeout(), fast_streams());
    auto sub = client.subscribe_memory();
    CHECK_THROWS_AS(sub.recv(), NotFoundError);
  }
  CHECK(ctl.accepted_streams() == 0);
}

TEST_CASE("log subscriptions filter by level") {
  fake::Controller ctl;
  ctl.stream("/logs",
             {R"({"type":"debug","payload":"dns lookup"})", R"({"type":"info","payload":"tcp dial"})",
              R"({"type":"warning","payload":"slow node"})", R"({"type":"error","payload":"dial failed"})",
              "garbage", R"({"type":"info","payload":"last"})"},
             5ms, false);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());

  auto sub = client.subscribe_logs(LogLevel::Warning);
  auto a = sub.recv_for(1000ms);
  auto b = sub.recv_for(1000ms);
  REQUIRE(a);
  REQUIRE(b);
  CHECK(a->level == LogLevel::Warning);
  CHECK(a->payload == "slow node");
  CHECK(b->level == LogLevel::Error);
  CHECK_FALSE(sub.recv_for(200ms));
  auto req = ctl.requests().back();
  CHECK(req.target == "/logs?level=warning");
}

TEST_CASE("memory reads a single sample") {
  fake::Controller ctl;
  ctl.stream("/memory", {R"({"inuse":4096,"oslimit":8192})"}, 20ms);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());
  auto m = client.memory();
  CHECK(m.inuse == 4096);
  CHECK(m.oslimit == 8192);
  CHECK(wait_until([&] { return ctl.live_streams() == 0; }, 1000ms));
}

TEST_CASE("closing a subscription during a stalled handshake returns promptly") {
  fake::Controller ctl;
  ctl.stall("/traffic");
  ControllerSettings slow;
  slow.timeout_ms = 10000;
  ControlPlaneClient client(ctl.url(), "", slow, fast_streams());

  auto sub = client.subscribe_traffic();
  REQUIRE(wait_until([&] { return !ctl.requests().empty(); }, 2000ms));

  const auto t0 = std::chrono::steady_clock::now();
  sub.close();
  // bounded by the 50ms poll interval, not the 10s handshake timeout
  CHECK(std::chrono::steady_clock::now() - t0 < 1000ms);
  CHECK_FALSE(sub.is_open());
  CHECK(client.open_streams() == 0);
  CHECK(ctl.accepted_streams() == 0);
}

TEST_CASE("frames that fail to decode are skipped without ending the stream") {
  fake::Controller ctl;
  ctl.stream("/traffic", {"[1,2]", R"({"up":"lots","down":1})", "null", R"({"up":7,"down":8})"}, 5ms, false);
  ControlPlaneClient client(ctl.url(), "", short_timeout(), fast_streams());

  auto sub = client.subscribe_traffic();
  auto t = sub.recv_for(1000ms);
  REQUIRE(t);
  CHECK(t->up == 7);
  CHECK(t->down == 8);
  CHECK(sub.is_open());
  CHECK(ctl.accepted_streams() == 1);
}
