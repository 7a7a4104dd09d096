#include <catch2/catch_all.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/pointer.hpp>
#include <mihomoctl/profile_store.hpp>
#include <mihomoctl/version_store.hpp>

#include "support/test_util.hpp"

#include <thread>
#include <vector>

using namespace mihomoctl;
using namespace testutil;
namespace fs = std::filesystem;

// Stages and publishes a version the way the installer does.
static void install_fake(const VersionStore &store, const std::string &id) {
  auto staging = store.create_staging(id);
  write_script(staging / VersionStore::kBinaryName, kSleeper);
  REQUIRE(store.publish(staging, id));
}

TEST_CASE("valid_key rejects path-like keys") {
  CHECK(valid_key("v1.18.0"));
  CHECK(valid_key("alpha-3f2a1b"));
  CHECK_FALSE(valid_key(""));
  CHECK_FALSE(valid_key(".hidden"));
  CHECK_FALSE(valid_key("../etc"));
  CHECK_FALSE(valid_key("a/b"));
  CHECK_FALSE(valid_key("with space"));
}

TEST_CASE("atomic pointer write, read, clear") {
  auto dir = mkd("pointer");
  AtomicPointer p(dir / "default");

  CHECK_FALSE(p.read());
  p.write("v1");
  REQUIRE(p.read() == std::optional<std::string>("v1"));
  p.write("v2");
  REQUIRE(p.read() == std::optional<std::string>("v2"));
  p.clear();
  CHECK_FALSE(p.read());
  CHECK_FALSE(fs::exists(p.file()));
}

TEST_CASE("concurrent pointer writers never leave a torn value") {
  auto dir = mkd("pointer_race");
  AtomicPointer p(dir / "current");
  p.write("aaaaaaaa");

  std::atomic<bool> stop{false};
  std::atomic<int> bad{0};
  std::thread reader([&] {
    while (!stop.load()) {
      auto v = p.read();
      if (v && *v != "aaaaaaaa" && *v != "bbbbbbbb") ++bad;
    }
  });
  std::vector<std::thread> writers;
  for (int w = 0; w < 4; ++w) {
    writers.emplace_back([&, w] {
      for (int i = 0; i < 200; ++i) p.write(w % 2 ? "aaaaaaaa" : "bbbbbbbb");
    });
  }
  for (auto &t : writers) t.join();
  stop = true;
  reader.join();

  CHECK(bad.load() == 0);
  auto v = p.read();
  REQUIRE(v);
  CHECK((*v == "aaaaaaaa" || *v == "bbbbbbbb"));
}

TEST_CASE("version store only lists published versions") {
  auto home = make_home("vstore_publish");
  VersionStore store(home);

  SECTION("staging is invisible") {
    auto staging = store.create_staging("v1.0.0");
    write_script(staging / VersionStore::kBinaryName, kSleeper);
    CHECK(store.list().empty());
    CHECK_FALSE(store.find("v1.0.0"));
    REQUIRE(store.publish(staging, "v1.0.0"));
    REQUIRE(store.list().size() == 1);
    CHECK(store.list()[0].installed_at > 0);
  }

  SECTION("a directory without marker or binary is ignored") {
    fs::create_directories(home.versions_dir() / "v2.0.0");
    write_file(home.versions_dir() / "v3.0.0" / ".installed", "1\n");
    CHECK(store.list().empty());
  }

  SECTION("a second publish of the same id loses and keeps the first") {
    install_fake(store, "v1.0.0");
    auto again = store.create_staging("v1.0.0");
    write_script(again / VersionStore::kBinaryName, "#!/bin/sh\nexit 0\n");
    CHECK_FALSE(store.publish(again, "v1.0.0"));
    store.discard(again);
    REQUIRE(store.list().size() == 1);
    CHECK(read_all(store.list()[0].binary) == kSleeper);
  }
}

TEST_CASE("sweep_staging removes leftovers of dead installers") {
  auto home = make_home("vstore_sweep");
  VersionStore store(home);

  // pid 0x7ffffff0 is not a live process
  auto stale = home.staging_dir() / "v1.0.0.2147483632.1";
  fs::create_directories(stale);
  write_file(stale / "mihomo", "partial");
  auto mine = store.create_staging("v2.0.0");

  store.sweep_staging();
  CHECK_FALSE(fs::exists(stale));
  CHECK(fs::exists(mine));
  CHECK(store.list().empty());
}

TEST_CASE("default pointer references an installed version or nothing") {
  auto home = make_home("vstore_default");
  VersionStore store(home);

  SECTION("set_default rejects unknown versions") {
    CHECK_THROWS_AS(store.set_default("v9.9.9"), NotFoundError);
    CHECK_FALSE(store.default_id());
  }

  SECTION("removing the default clears it") {
    install_fake(store, "v1.0.0");
    install_fake(store, "v1.1.0");
    store.set_default("v1.0.0");
    REQUIRE(store.default_id() == std::optional<std::string>("v1.0.0"));
    store.remove("v1.0.0");
    CHECK_FALSE(store.default_id());
    REQUIRE(store.list().size() == 1);
    CHECK(store.list()[0].id == "v1.1.0");
    CHECK_FALSE(store.list()[0].is_default);
  }

  SECTION("a dangling pointer written behind our back reads as unset") {
    install_fake(store, "v1.0.0");
    io::atomic_write(home.versions_dir() / "default", "v0.0.1\n");
    CHECK_FALSE(store.default_id());
    for (auto &v : store.list()) CHECK_FALSE(v.is_default);
  }

  SECTION("removing a missing version is NotFound") {
    CHECK_THROWS_AS(store.remove("v1.0.0"), NotFoundError);
  }
}

TEST_CASE("profile store keeps current consistent") {
  auto home = make_home("pstore");
  ProfileStore store(home);

  store.write("home", "mixed-port: 7890\n");
  store.write("work", "mixed-port: 7891\n");
  auto list = store.list();
  REQUIRE(list.size() == 2);
  CHECK(list[0].name == "home");
  CHECK(list[1].name == "work");
  CHECK_FALSE(store.current());

  store.set_current("work");
  REQUIRE(store.current() == std::optional<std::string>("work"));
  CHECK(store.find("work")->active);
  CHECK_FALSE(store.find("home")->active);

  CHECK_THROWS_AS(store.set_current("nope"), NotFoundError);
  CHECK(store.current() == std::optional<std::string>("work"));

  store.remove("work");
  CHECK_FALSE(store.current());
  CHECK_THROWS_AS(store.remove("work"), NotFoundError);

  CHECK_THROWS_AS(store.path_for("../escape"), ValidationError);
  CHECK_THROWS_AS(store.path_for("current"), ValidationError);
}
