#include <catch2/catch_all.hpp>
#include <mihomoctl/io.hpp>

#include "support/test_util.hpp"

#include <sys/stat.h>

using namespace mihomoctl;
using namespace testutil;
namespace fs = std::filesystem;

TEST_CASE("log rotation keeps a bounded number of backups") {
  auto d = mkd("logrot");
  auto base = d / "mihomo.out";

  write_file(base, std::string(2000, 'x'));
  io::rotate_logs(base, 1024, 3);
  CHECK_FALSE(fs::exists(base));
  REQUIRE(fs::exists(d / "mihomo.out.1"));

  for (char c : {'y', 'z', 'w'}) {
    write_file(base, std::string(2000, c));
    io::rotate_logs(base, 1024, 3);
  }
  CHECK(read_all(d / "mihomo.out.1") == std::string(2000, 'w'));
  CHECK(read_all(d / "mihomo.out.2") == std::string(2000, 'z'));
  CHECK(read_all(d / "mihomo.out.3") == std::string(2000, 'y'));
  CHECK_FALSE(fs::exists(d / "mihomo.out.4"));

  write_file(base, "small");
  io::rotate_logs(base, 1024, 3);
  CHECK(read_all(base) == "small");
}

TEST_CASE("atomic_write replaces content and leaves no temporaries") {
  auto d = mkd("atomic");
  auto target = d / "sub" / "file.txt";

  io::atomic_write(target, "first\n");
  CHECK(io::read_file(target) == std::optional<std::string>("first\n"));
  io::atomic_write(target, "second\n", 0755);
  CHECK(io::read_file(target) == std::optional<std::string>("second\n"));

  struct stat st {};
  REQUIRE(::stat(target.c_str(), &st) == 0);
  CHECK((st.st_mode & 0777) == 0755);

  int entries = 0;
  for (auto &e : fs::directory_iterator(target.parent_path())) {
    (void)e;
    ++entries;
  }
  CHECK(entries == 1);
  CHECK_FALSE(io::read_file(d / "missing"));
}
