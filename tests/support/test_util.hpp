#pragma once
#include <mihomoctl/downloader.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/home.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

namespace testutil {

namespace fs = std::filesystem;

// Fresh, empty directory under the system temp dir.
inline fs::path mkd(const std::string &name) {
  auto d = fs::temp_directory_path() / ("mihomoctl_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

inline mihomoctl::HomeContext make_home(const std::string &name) {
  mihomoctl::HomeContext home(mkd(name));
  home.ensure_layout();
  return home;
}

inline void write_file(const fs::path &p, const std::string &content) {
  fs::create_directories(p.parent_path());
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << content;
}

inline std::string read_all(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Stands in for mihomo: stays alive until signalled.
inline const char *kSleeper = "#!/bin/sh\nwhile :; do sleep 1; done\n";

inline fs::path write_script(const fs::path &p, const std::string &body) {
  write_file(p, body);
  ::chmod(p.c_str(), 0755);
  return p;
}

template <class Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// In-memory release feed. Unknown URLs fail the way a 404 does over HTTP.
class CountingFetcher : public mihomoctl::Fetcher {
public:
  std::map<std::string, std::string> bodies;
  std::chrono::milliseconds delay{0};
  std::atomic<int> calls{0};
  std::atomic<int> artifact_calls{0};

  std::string get(const std::string &url) override {
    ++calls;
    if (url.size() > 3 && url.compare(url.size() - 3, 3, ".gz") == 0) ++artifact_calls;
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    auto it = bodies.find(url);
    if (it == bodies.end()) throw mihomoctl::NetworkError("GET " + url + ": HTTP 404");
    return it->second;
  }
};

// A feed whose stable channel resolves to `version` and whose artifact for
// it is the sleeper script.
inline std::shared_ptr<CountingFetcher> release_feed(const mihomoctl::ReleaseSettings &rs,
                                                     const std::string &version) {
  auto f = std::make_shared<CountingFetcher>();
  f->bodies[rs.api_url + "/releases/latest"] = R"({"tag_name":")" + version + R"(","prerelease":false})";
  mihomoctl::Downloader d(rs, f);
  f->bodies[d.artifact_url(version)] = kSleeper;
  return f;
}

} // namespace testutil
