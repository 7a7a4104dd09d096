#include <catch2/catch_all.hpp>
#include <mihomoctl/config_manager.hpp>
#include <mihomoctl/control_client.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/process.hpp>
#include <mihomoctl/service_manager.hpp>
#include <mihomoctl/version_manager.hpp>

#include "support/fake_controller.hpp"
#include "support/test_util.hpp"

#include <signal.h>

using namespace mihomoctl;
using namespace testutil;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static ReleaseSettings feed_settings() {
  ReleaseSettings rs;
  rs.api_url = "https://feed.test/repos/mihomo";
  rs.download_url = "https://feed.test/download";
  return rs;
}

static ServiceSettings fast_service() {
  ServiceSettings s;
  s.stop_timeout_sec = 2;
  s.probe_ms = 200;
  return s;
}

TEST_CASE("install, configure, start and stop") {
  auto home = make_home("scenario_lifecycle");
  auto rs = feed_settings();
  auto feed = release_feed(rs, "v1.18.0");

  VersionManager vm(home, Downloader(rs, feed));
  auto v = vm.install("stable");
  CHECK(v.id == "v1.18.0");
  vm.set_default(v.id);

  ConfigManager cm(home);
  auto profile = cm.ensure_default_config();
  REQUIRE(profile);
  CHECK(profile->name == "default");
  CHECK(fs::is_regular_file(home.configs_dir() / "default.yaml"));
  CHECK(read_all(home.configs_dir() / "current") == "default\n");
  auto endpoint = cm.ensure_external_controller();
  CHECK_FALSE(endpoint.secret.empty());

  ServiceManager svc(home, vm.binary_path(), cm.get_current_path(), fast_service());
  auto st = svc.start();
  REQUIRE(st.kind == ServiceStateKind::Running);
  CHECK(st.pid() > 0);
  CHECK(svc.status().kind == ServiceStateKind::Running);
  CHECK(svc.status().pid() == st.pid());

  SECTION("the running version and profile are protected") {
    CHECK_THROWS_AS(vm.uninstall("v1.18.0"), ConflictError);
    CHECK_THROWS_AS(cm.delete_profile("default"), ConflictError);
  }
  SECTION("a new default only applies on restart") {
    feed->bodies[Downloader(rs, feed).artifact_url("v1.19.0")] = kSleeper;
    vm.install("v1.19.0");
    vm.set_default("v1.19.0");
    CHECK(svc.status().record->binary == v.binary);
    svc.rebind(vm.binary_path(), cm.get_current_path());
    auto r = svc.restart();
    REQUIRE(r.is_running());
    CHECK(r.record->binary == home.versions_dir() / "v1.19.0" / "mihomo");
    CHECK_NOTHROW(vm.uninstall("v1.18.0"));
  }

  auto stopped = svc.stop();
  CHECK(stopped.kind == ServiceStateKind::Stopped);
  CHECK(svc.status().kind == ServiceStateKind::Stopped);
  CHECK_FALSE(fs::exists(home.pid_file()));
}

TEST_CASE("a crash is seen by status while streams keep retrying") {
  auto home = make_home("scenario_crash");
  auto binary = write_script(home.versions_dir() / "v1.18.0" / "mihomo", kSleeper);
  auto config = home.configs_dir() / "default.yaml";
  write_file(config, "mixed-port: 7890\n");

  auto ctl = std::make_unique<fake::Controller>("s3cret");
  ctl->stream("/traffic", {R"({"up":512,"down":2048})"}, 20ms);

  ServiceManager svc(home, binary, config, fast_service());
  auto st = svc.start();
  REQUIRE(st.is_running());

  StreamSettings ss;
  ss.reconnect_attempts = 3;
  ss.reconnect_base_ms = 20;
  ss.reconnect_max_ms = 80;
  ss.poll_ms = 50;
  ControlPlaneClient client(ctl->url(), "s3cret", ControllerSettings{}, ss);
  auto sub = client.subscribe_traffic();
  auto sample = sub.recv();
  REQUIRE(sample);
  CHECK(sample->down == 2048);

  // the instance dies out of band and takes its controller with it
  ::kill(st.pid(), SIGKILL);
  REQUIRE(wait_until([&] { return !ProcessRunner::alive(st.pid()); }, 2000ms));
  ctl->stop();

  auto crashed = svc.status();
  CHECK(crashed.kind == ServiceStateKind::Crashed);
  CHECK(crashed.pid() == st.pid());
  CHECK(svc.status().kind == ServiceStateKind::Stopped);

  const auto t0 = std::chrono::steady_clock::now();
  bool failed = false;
  for (int i = 0; i < 20 && !failed; ++i) {
    try {
      sub.recv();
    } catch (const NetworkError &) {
      failed = true;
    }
  }
  CHECK(failed);
  // backed-off retries, not an immediate failure
  CHECK(std::chrono::steady_clock::now() - t0 >= 60ms);
  CHECK_FALSE(sub.is_open());
  CHECK(client.open_streams() == 0);
}
