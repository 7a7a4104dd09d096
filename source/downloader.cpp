#include <mihomoctl/downloader.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/http.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/types.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

#ifndef MIHOMOCTL_VERSION
#define MIHOMOCTL_VERSION "dev"
#endif

namespace fs = std::filesystem;

namespace mihomoctl {

std::optional<ReleaseChannel> parse_channel(const std::string &s) {
  std::string v = s;
  for (auto &c : v) c = (char)std::tolower((unsigned char)c);
  if (v == "stable" || v == "latest") return ReleaseChannel::Stable;
  if (v == "beta") return ReleaseChannel::Beta;
  if (v == "nightly" || v == "alpha") return ReleaseChannel::Nightly;
  return std::nullopt;
}

const char *channel_name(ReleaseChannel c) {
  switch (c) {
    case ReleaseChannel::Stable: return "stable";
    case ReleaseChannel::Beta: return "beta";
    case ReleaseChannel::Nightly: return "nightly";
  }
  return "stable";
}

void Fetcher::download(const std::string &url, const fs::path &dest) {
  io::atomic_write(dest, get(url));
}

static http::Headers fetch_headers() {
  http::Headers h;
  h["User-Agent"] = std::string("mihomoctl/") + MIHOMOCTL_VERSION;
  h["Accept"] = "*/*";
  return h;
}

std::string HttpFetcher::get(const std::string &url) {
  auto r = http::get(url, fetch_headers(), std::chrono::seconds(timeout_sec_));
  if (r.status < 200 || r.status >= 300)
    throw NetworkError("GET " + url + ": HTTP " + std::to_string(r.status));
  return std::move(r.body);
}

void HttpFetcher::download(const std::string &url, const fs::path &dest) {
  int status = 0;
  try {
    status = http::download(url, fetch_headers(), dest, std::chrono::seconds(timeout_sec_)).status;
  } catch (const Error &) {
    std::error_code ec;
    fs::remove(dest, ec);
    throw;
  }
  if (status < 200 || status >= 300) {
    std::error_code ec;
    fs::remove(dest, ec);
    throw NetworkError("GET " + url + ": HTTP " + std::to_string(status));
  }
}

Downloader::Downloader(ReleaseSettings settings, std::shared_ptr<Fetcher> fetcher)
    : settings_(std::move(settings)), fetcher_(std::move(fetcher)) {
  if (!fetcher_) fetcher_ = std::make_shared<HttpFetcher>(settings_.timeout_sec);
  while (!settings_.api_url.empty() && settings_.api_url.back() == '/') settings_.api_url.pop_back();
  while (!settings_.download_url.empty() && settings_.download_url.back() == '/')
    settings_.download_url.pop_back();
}

static Json::Value parse_feed(const std::string &body, const std::string &what) {
  auto j = parse_json(body);
  if (!j) throw ValidationError(what + ": unparseable release feed");
  return *j;
}

static std::string tag_of(const Json::Value &r) {
  return r.isObject() && r["tag_name"].isString() ? r["tag_name"].asString() : std::string{};
}

static bool is_prerelease(const Json::Value &r) {
  return r.isObject() && r["prerelease"].isBool() && r["prerelease"].asBool();
}

static std::string trim(std::string s) {
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
  size_t i = 0;
  while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
  return s.substr(i);
}

std::string Downloader::resolve(ReleaseChannel channel) const {
  std::string version;
  switch (channel) {
    case ReleaseChannel::Stable: {
      version = tag_of(parse_feed(fetcher_->get(settings_.api_url + "/releases/latest"), "stable"));
      break;
    }
    case ReleaseChannel::Beta: {
      const auto j = parse_feed(fetcher_->get(settings_.api_url + "/releases?per_page=30"), "beta");
      if (j.isArray()) {
        for (const auto &r : j) {
          if (is_prerelease(r) && !tag_of(r).empty()) {
            version = tag_of(r);
            break;
          }
        }
      }
      break;
    }
    case ReleaseChannel::Nightly:
      version = trim(fetcher_->get(settings_.download_url + "/Prerelease-Alpha/version.txt"));
      break;
  }
  if (version.empty())
    throw NotFoundError(std::string("no release published on the ") + channel_name(channel) + " channel");
  spdlog::info("[release] {} -> {}", channel_name(channel), version);
  return version;
}

std::vector<RemoteRelease> Downloader::list_remote(int limit) const {
  if (limit <= 0) limit = 10;
  const auto j = parse_feed(
      fetcher_->get(settings_.api_url + "/releases?per_page=" + std::to_string(limit)), "list-remote");
  std::vector<RemoteRelease> out;
  if (!j.isArray()) throw ValidationError("list-remote: unexpected release feed");
  for (const auto &r : j) {
    if (tag_of(r).empty()) continue;
    RemoteRelease rel;
    rel.version = tag_of(r);
    rel.prerelease = is_prerelease(r);
    if (r["published_at"].isString()) rel.published_at = r["published_at"].asString();
    out.push_back(std::move(rel));
    if ((int)out.size() >= limit) break;
  }
  return out;
}

std::string Downloader::host_arch() {
  utsname u{};
  std::string m = ::uname(&u) == 0 ? u.machine : "";
  if (m == "aarch64" || m == "arm64") return "arm64";
  if (m.rfind("arm", 0) == 0) return "armv7";
  return "amd64";
}

std::string Downloader::artifact_url(const std::string &version) const {
  // nightly builds live under a fixed tag
  const std::string tag = version.rfind("alpha", 0) == 0 ? "Prerelease-Alpha" : version;
  return settings_.download_url + "/" + tag + "/mihomo-linux-" + host_arch() + "-" + version + ".gz";
}

struct ArchiveDeleter {
  void operator()(struct archive *a) const { archive_read_free(a); }
};

static std::string archive_err(struct archive *a) {
  const char *e = archive_error_string(a);
  return e ? e : "unknown error";
}

static bool is_gzip(const fs::path &file) {
  unsigned char magic[2] = {0, 0};
  std::ifstream in(file, std::ios::binary);
  in.read(reinterpret_cast<char *>(magic), 2);
  return in.gcount() == 2 && magic[0] == 0x1f && magic[1] == 0x8b;
}

// Inflates `src` into `dest`; returns the number of bytes written.
static std::uintmax_t gunzip(const fs::path &src, const fs::path &dest) {
  std::unique_ptr<struct archive, ArchiveDeleter> a(archive_read_new());
  if (!a) throw IOError("archive_read_new failed");
  archive_read_support_filter_gzip(a.get());
  archive_read_support_format_raw(a.get());
  if (archive_read_open_filename(a.get(), src.c_str(), 64 * 1024) != ARCHIVE_OK)
    throw ValidationError("artifact is not a valid gzip stream: " +
                          archive_err(a.get()));

  struct archive_entry *entry = nullptr;
  if (archive_read_next_header(a.get(), &entry) != ARCHIVE_OK)
    throw ValidationError("artifact is not a valid gzip stream: " +
                          archive_err(a.get()));

  std::ofstream out(dest, std::ios::binary | std::ios::trunc);
  if (!out) throw IOError("cannot create " + dest.string());
  std::uintmax_t total = 0;
  char buf[64 * 1024];
  la_ssize_t n;
  while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
    out.write(buf, n);
    total += static_cast<std::uintmax_t>(n);
  }
  if (n < 0)
    throw ValidationError("artifact decompression failed: " + archive_err(a.get()));
  out.close();
  if (!out) throw IOError("cannot write " + dest.string());
  return total;
}

fs::path Downloader::fetch(const std::string &version, const fs::path &dir,
                           const std::string &name) const {
  const auto url = artifact_url(version);
  const auto dest = dir / name;
  const auto raw = dir / ("." + name + ".download");
  spdlog::info("[version={}] downloading {}", version, url);

  std::uintmax_t size = 0;
  try {
    fetcher_->download(url, raw);
    spdlog::debug("[version={}] received {} bytes", version, fs::file_size(raw));
    if (is_gzip(raw)) {
      size = gunzip(raw, dest);
      fs::remove(raw);
    } else {
      fs::rename(raw, dest);
      size = fs::file_size(dest);
    }
  } catch (const fs::filesystem_error &e) {
    std::error_code ec;
    fs::remove(raw, ec);
    throw IOError(std::string("artifact for ") + version + ": " + e.what());
  } catch (const Error &) {
    std::error_code ec;
    fs::remove(raw, ec);
    throw;
  }

  if (size == 0) throw ValidationError("artifact for " + version + " is empty");
  if (::chmod(dest.c_str(), 0755) != 0 || ::access(dest.c_str(), X_OK) != 0)
    throw ValidationError("artifact for " + version + " is not executable");
  return dest;
}

} // namespace mihomoctl
