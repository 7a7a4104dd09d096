#pragma once
#include "settings.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

enum class ReleaseChannel { Stable, Beta, Nightly };

// "stable", "beta", "nightly" (any case); nullopt for anything else.
std::optional<ReleaseChannel> parse_channel(const std::string &s);
const char *channel_name(ReleaseChannel c);

// Body of a successful GET. NetworkError on transport failure or non-2xx.
class Fetcher {
public:
  virtual ~Fetcher() = default;
  virtual std::string get(const std::string &url) = 0;
  // Same, with the body written to `dest`. The default stores get(url).
  virtual void download(const std::string &url, const std::filesystem::path &dest);
};

class HttpFetcher : public Fetcher {
public:
  explicit HttpFetcher(int timeout_sec = 60) : timeout_sec_(timeout_sec) {}
  std::string get(const std::string &url) override;
  // Streams to disk; a failed transfer leaves no file behind.
  void download(const std::string &url, const std::filesystem::path &dest) override;

private:
  int timeout_sec_;
};

struct RemoteRelease {
  std::string version;
  bool prerelease = false;
  std::string published_at;
};

// Release feed and artifact access. Knows nothing about the on-disk store.
class Downloader {
public:
  explicit Downloader(ReleaseSettings settings, std::shared_ptr<Fetcher> fetcher = nullptr);

  std::string resolve(ReleaseChannel channel) const;
  std::vector<RemoteRelease> list_remote(int limit) const;

  std::string artifact_url(const std::string &version) const;

  // Fetches the artifact for `version` into `dir`/`name`, gunzipping it when
  // compressed, and checks the result is a non-empty executable file.
  // ValidationError when the payload fails those checks.
  std::filesystem::path fetch(const std::string &version, const std::filesystem::path &dir,
                              const std::string &name) const;

  // amd64, arm64 or armv7
  static std::string host_arch();

private:
  ReleaseSettings settings_;
  std::shared_ptr<Fetcher> fetcher_;
};

} // namespace mihomoctl
