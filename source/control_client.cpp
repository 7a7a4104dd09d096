#include <mihomoctl/control_client.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/http.hpp>
#include <mihomoctl/websocket.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

using namespace std::chrono;

namespace mihomoctl {

ControlPlaneClient::ControlPlaneClient(std::string base_url, std::string secret,
                                       ControllerSettings controller, StreamSettings stream)
    : base_url_(std::move(base_url)), secret_(std::move(secret)), controller_(controller),
      stream_(stream), open_streams_(std::make_shared<std::atomic<int>>(0)) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
  if (base_url_.find("://") == std::string::npos) base_url_ = "http://" + base_url_;
}

static std::string error_message(const http::Response &r) {
  auto j = parse_json(r.body);
  if (j && j->isObject() && (*j)["message"].isString()) return (*j)["message"].asString();
  return r.body.empty() ? http::reason_phrase(r.status) : r.body;
}

Json::Value ControlPlaneClient::call(const std::string &method, const std::string &target,
                              const std::string &body, int timeout_ms) const {
  const Url url = Url::parse(base_url_ + target);
  http::Request req;
  req.method = method;
  req.target = url.target;
  req.headers["Accept"] = "application/json";
  if (!secret_.empty()) req.headers["Authorization"] = "Bearer " + secret_;
  if (!body.empty()) {
    req.headers["Content-Type"] = "application/json";
    req.body = body;
  }

  const auto timeout = milliseconds(timeout_ms > 0 ? timeout_ms : controller_.timeout_ms);
  http::Response r;
  try {
    r = http::send(url, req, timeout);
  } catch (const NetworkError &e) {
    Error::wrap(e, method + " " + target);
  }

  const std::string what = method + " " + target + ": ";
  if (r.status == 401 || r.status == 403) throw AuthError(what + "unauthorized (check the controller secret)");
  if (r.status == 404) throw NotFoundError(what + error_message(r));
  if (r.status == 400) throw ValidationError(what + error_message(r));
  if (r.status < 200 || r.status >= 300)
    throw NetworkError(what + "HTTP " + std::to_string(r.status) + ": " + error_message(r));

  if (r.body.empty()) return Json::Value();
  auto j = parse_json(r.body);
  if (!j) throw ValidationError(what + "unparseable response body");
  return *j;
}

template <class T> static T decode_as(const Json::Value &j, const std::string &what) {
  T out;
  try {
    decode(j, out);
  } catch (const ValidationError &e) {
    throw ValidationError(what + ": unexpected response: " + e.what());
  }
  return out;
}

ControllerVersion ControlPlaneClient::version() const {
  return decode_as<ControllerVersion>(call("GET", "/version"), "version");
}

std::vector<ProxyInfo> ControlPlaneClient::proxies() const {
  auto j = call("GET", "/proxies");
  std::vector<ProxyInfo> out;
  if (!j.isObject() || !j["proxies"].isObject()) throw ValidationError("proxies: unexpected response");
  const auto &all = j["proxies"];
  for (const auto &name : all.getMemberNames()) {
    auto p = decode_as<ProxyInfo>(all[name], "proxies");
    if (p.name.empty()) p.name = name;
    out.push_back(std::move(p));
  }
  return out;
}

ProxyInfo ControlPlaneClient::proxy(const std::string &name) const {
  return decode_as<ProxyInfo>(call("GET", "/proxies/" + percent_encode(name)), "proxy " + name);
}

std::vector<ProxyGroup> ControlPlaneClient::proxy_groups() const {
  std::vector<ProxyGroup> out;
  for (auto &p : proxies()) {
    if (!p.is_group()) continue;
    out.push_back(ProxyGroup{p.name, p.type, p.now.value_or(""), p.all});
  }
  return out;
}

void ControlPlaneClient::switch_proxy(const std::string &group, const std::string &proxy) const {
  Json::Value body;
  body["name"] = proxy;
  call("PUT", "/proxies/" + percent_encode(group), write_json(body));
  spdlog::info("[proxy] {} -> {}", group, proxy);
}

int ControlPlaneClient::test_delay(const std::string &proxy, const std::string &url,
                                   int timeout_ms) const {
  auto target = "/proxies/" + percent_encode(proxy) + "/delay?url=" + percent_encode(url) +
                "&timeout=" + std::to_string(timeout_ms);
  auto j = call("GET", target, {}, std::max(controller_.timeout_ms, timeout_ms + 1000));
  if (!j.isObject() || !j["delay"].isInt()) throw ValidationError("delay: unexpected response");
  return j["delay"].asInt();
}

ConnectionsSnapshot ControlPlaneClient::connections() const {
  return decode_as<ConnectionsSnapshot>(call("GET", "/connections"), "connections");
}

void ControlPlaneClient::close_connection(const std::string &id) const {
  call("DELETE", "/connections/" + percent_encode(id));
}

void ControlPlaneClient::close_all_connections() const { call("DELETE", "/connections"); }

void ControlPlaneClient::reload_config(const std::optional<std::string> &path) const {
  Json::Value body;
  body["path"] = path.value_or("");
  call("PUT", "/configs?force=true", write_json(body));
  spdlog::info("[controller] configuration reloaded");
}

bool ControlPlaneClient::healthy() const {
  try {
    (void)version();
    return true;
  } catch (const std::exception &e) {
    spdlog::debug("[controller] health probe failed: {}", e.what());
    return false;
  }
}

std::string ControlPlaneClient::ws_url(const std::string &target) const {
  auto sep = base_url_.find("://");
  auto scheme = base_url_.substr(0, sep);
  return (scheme == "https" ? "wss" : "ws") + base_url_.substr(sep) + target;
}

MemorySample ControlPlaneClient::memory() const {
  http::Headers headers;
  if (!secret_.empty()) headers["Authorization"] = "Bearer " + secret_;
  const auto timeout = milliseconds(controller_.timeout_ms);
  const auto deadline = steady_clock::now() + timeout;
  try {
    ws::Client ws(Url::parse(ws_url("/memory")), headers, timeout, milliseconds(stream_.poll_ms));
    while (steady_clock::now() < deadline) {
      auto msg = ws.read_message(milliseconds(stream_.poll_ms));
      if (!msg) continue;
      auto j = parse_json(*msg);
      if (!j) throw ValidationError("memory: unparseable frame");
      return decode_as<MemorySample>(*j, "memory");
    }
  } catch (const NetworkError &e) {
    Error::wrap(e, "memory");
  }
  throw NetworkError("memory: no sample within " + std::to_string(controller_.timeout_ms) + "ms");
}

namespace {

struct StreamSpec {
  std::string tag;
  Url url;
  http::Headers headers;
  StreamSettings settings;
  milliseconds connect_timeout{5000};
  std::shared_ptr<std::atomic<int>> open;
};

// Holds one open stream connection in the open_streams() count.
struct OpenStream {
  ws::Client &client;
  std::atomic<int> &count;
  OpenStream(ws::Client &c, std::atomic<int> &n) : client(c), count(n) { ++count; }
  ~OpenStream() {
    client.close();
    --count;
  }
};

milliseconds backoff(const StreamSettings &s, int attempt) {
  long long d = s.reconnect_base_ms;
  for (int i = 1; i < attempt && d < s.reconnect_max_ms; ++i) d *= 2;
  return milliseconds(std::min<long long>(d, s.reconnect_max_ms));
}

template <class T>
void stream_loop(Sender<T> tx, const StreamSpec &spec, const std::function<bool(const T &)> &keep) {
  int failures = 0;
  std::string last_error;
  while (!tx.receiver_closed()) {
    bool received = false;
    try {
      ws::Client client(spec.url, spec.headers, spec.connect_timeout, milliseconds(spec.settings.poll_ms),
                        [&tx] { return tx.receiver_closed(); });
      OpenStream held(client, *spec.open);
      spdlog::debug("[stream={}] connected", spec.tag);
      while (!tx.receiver_closed()) {
        auto msg = client.read_message(milliseconds(spec.settings.poll_ms));
        if (!msg) continue;
        received = true;
        auto j = parse_json(*msg);
        if (!j) {
          spdlog::warn("[stream={}] skipping unparseable frame", spec.tag);
          continue;
        }
        T item;
        try {
          decode(*j, item);
        } catch (const std::exception &e) {
          spdlog::warn("[stream={}] skipping frame: {}", spec.tag, e.what());
          continue;
        }
        if (!keep(item)) continue;
        if (!tx.send(std::move(item))) break;
      }
    } catch (const Error &e) {
      if (e.kind() == ErrorKind::Auth || e.kind() == ErrorKind::NotFound) {
        spdlog::error("[stream={}] {}", spec.tag, e.what());
        tx.close(std::current_exception());
        return;
      }
      last_error = e.what();
      spdlog::warn("[stream={}] connection lost: {}", spec.tag, e.what());
    } catch (const std::exception &e) {
      spdlog::error("[stream={}] {}", spec.tag, e.what());
      tx.close(std::make_exception_ptr(NetworkError("stream " + spec.tag + ": " + e.what())));
      return;
    }
    if (tx.receiver_closed()) break;

    if (received) failures = 0;
    if (++failures > spec.settings.reconnect_attempts) {
      spdlog::error("[stream={}] giving up after {} attempts", spec.tag, failures - 1);
      tx.close(std::make_exception_ptr(NetworkError(
          "stream " + spec.tag + ": reconnect attempts exhausted: " + last_error)));
      return;
    }
    auto delay = backoff(spec.settings, failures);
    spdlog::info("[stream={}] reconnecting in {}ms (attempt {}/{})", spec.tag, delay.count(),
                 failures, spec.settings.reconnect_attempts);
    if (tx.wait_receiver_closed(delay)) break;
  }
  spdlog::debug("[stream={}] closed by consumer", spec.tag);
  tx.close();
}

template <class T>
Subscription<T> start_stream(StreamSpec spec, std::size_t capacity, Overflow policy,
                             std::function<bool(const T &)> keep) {
  auto ch = make_channel<T>(capacity, policy);
  std::thread task([tx = std::move(ch.first), spec = std::move(spec), keep = std::move(keep)]() mutable {
    stream_loop<T>(std::move(tx), spec, keep);
  });
  return Subscription<T>(std::move(ch.second), std::move(task));
}

} // namespace

Subscription<LogEntry> ControlPlaneClient::subscribe_logs(LogLevel min_level) const {
  StreamSpec spec{"logs", Url::parse(ws_url(std::string("/logs?level=") + log_level_name(min_level))),
                  {}, stream_, milliseconds(controller_.timeout_ms), open_streams_};
  if (!secret_.empty()) spec.headers["Authorization"] = "Bearer " + secret_;
  std::function<bool(const LogEntry &)> keep = [min_level](const LogEntry &e) {
    return min_level != LogLevel::Silent && e.level >= min_level;
  };
  return start_stream<LogEntry>(std::move(spec), static_cast<std::size_t>(stream_.log_buffer),
                                Overflow::Block, std::move(keep));
}

Subscription<TrafficSample> ControlPlaneClient::subscribe_traffic() const {
  StreamSpec spec{"traffic", Url::parse(ws_url("/traffic")), {}, stream_,
                  milliseconds(controller_.timeout_ms), open_streams_};
  if (!secret_.empty()) spec.headers["Authorization"] = "Bearer " + secret_;
  return start_stream<TrafficSample>(std::move(spec), 4, Overflow::DropOldest,
                                     [](const TrafficSample &) { return true; });
}

Subscription<MemorySample> ControlPlaneClient::subscribe_memory() const {
  StreamSpec spec{"memory", Url::parse(ws_url("/memory")), {}, stream_,
                  milliseconds(controller_.timeout_ms), open_streams_};
  if (!secret_.empty()) spec.headers["Authorization"] = "Bearer " + secret_;
  return start_stream<MemorySample>(std::move(spec), 4, Overflow::DropOldest,
                                    [](const MemorySample &) { return true; });
}

} // namespace mihomoctl
