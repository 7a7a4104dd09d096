#include <mihomoctl/error.hpp>
#include <mihomoctl/net.hpp>

#include "transport.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

using namespace std::chrono;

namespace mihomoctl {

static std::string default_port(const std::string &scheme) {
  return (scheme == "https" || scheme == "wss") ? "443" : "80";
}

Url Url::parse(const std::string &s) {
  auto sep = s.find("://");
  if (sep == std::string::npos || sep == 0)
    throw NetworkError("invalid url: " + s);

  Url u;
  u.scheme = s.substr(0, sep);
  for (auto &c : u.scheme) c = (char)std::tolower((unsigned char)c);
  if (u.scheme != "http" && u.scheme != "https" && u.scheme != "ws" && u.scheme != "wss")
    throw NetworkError("unsupported url scheme: " + s);

  std::string rest = s.substr(sep + 3);
  auto tpos = rest.find_first_of("/?");
  std::string auth = rest.substr(0, tpos);
  if (tpos != std::string::npos) {
    u.target = rest.substr(tpos);
    if (u.target.front() == '?') u.target = "/" + u.target;
  }
  if (auto at = auth.rfind('@'); at != std::string::npos) auth = auth.substr(at + 1);

  if (!auth.empty() && auth.front() == '[') {
    auto close = auth.find(']');
    if (close == std::string::npos) throw NetworkError("invalid url: " + s);
    u.host = auth.substr(1, close - 1);
    if (close + 1 < auth.size() && auth[close + 1] == ':') u.port = auth.substr(close + 2);
  } else if (auto colon = auth.rfind(':'); colon != std::string::npos) {
    u.host = auth.substr(0, colon);
    u.port = auth.substr(colon + 1);
  } else {
    u.host = auth;
  }
  if (u.host.empty()) throw NetworkError("invalid url (no host): " + s);
  if (u.port.empty()) u.port = default_port(u.scheme);
  if (!std::all_of(u.port.begin(), u.port.end(), [](unsigned char c) { return std::isdigit(c); }))
    throw NetworkError("invalid url port: " + s);
  return u;
}

std::string Url::authority() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port != default_port(scheme)) h += ":" + port;
  return h;
}

std::string Url::str() const { return scheme + "://" + authority() + target; }

Url Url::resolve(const std::string &location) const {
  if (location.find("://") != std::string::npos) return parse(location);
  if (location.rfind("//", 0) == 0) return parse(scheme + ":" + location);
  Url u = *this;
  if (!location.empty() && location.front() == '/') {
    u.target = location;
  } else {
    auto path = target.substr(0, target.find('?'));
    u.target = path.substr(0, path.rfind('/') + 1) + location;
  }
  return u;
}

std::string percent_encode(const std::string &s) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back((char)c);
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

namespace transport {

Wait run_until(asio::io_context &io, Clock::time_point until, milliseconds poll,
               const std::function<bool()> &cancelled) {
  if (io.stopped()) io.restart();
  for (;;) {
    const auto now = Clock::now();
    if (now >= until) return Wait::Expired;
    io.run_for(std::min<Clock::duration>(poll, until - now));
    if (io.stopped()) return Wait::Done;
    if (cancelled && cancelled()) return Wait::Cancelled;
  }
}

void await(asio::io_context &io, const Budget &budget, const std::function<void()> &abort,
           const std::string &what) {
  const auto w = run_until(io, budget.deadline, budget.poll, budget.cancelled);
  if (w == Wait::Done) return;
  abort();
  io.run();
  throw NetworkError(what + (w == Wait::Expired ? " timed out" : " cancelled"));
}

void open(asio::io_context &io, PlainStream &stream, const Url &url, const Budget &budget) {
  const auto where = url.authority();
  tcp::resolver resolver(io);
  tcp::resolver::results_type endpoints;
  beast::error_code ec;
  resolver.async_resolve(url.host, url.port,
                         [&](beast::error_code e, tcp::resolver::results_type r) {
                           ec = e;
                           endpoints = std::move(r);
                         });
  await(io, budget, [&] { resolver.cancel(); }, where + ": resolve");
  if (ec) throw NetworkError(where + ": resolve: " + ec.message());

  stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
  await(io, budget, [&] { stream.cancel(); }, where + ": connect");
  if (ec) throw NetworkError(where + ": connect: " + ec.message());

  stream.socket().set_option(tcp::no_delay(true), ec);
  if (ec) spdlog::debug("[net] {}: TCP_NODELAY: {}", where, ec.message());
}

void open(asio::io_context &io, TlsStream &stream, const Url &url, const Budget &budget) {
  const auto where = url.authority();
  open(io, beast::get_lowest_layer(stream), url, budget);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
    throw NetworkError(where + ": cannot set TLS server name");
  stream.set_verify_callback(asio::ssl::host_name_verification(url.host));

  beast::error_code ec;
  stream.async_handshake(asio::ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
  await(io, budget, [&] { beast::get_lowest_layer(stream).cancel(); }, where + ": TLS handshake");
  if (ec) throw NetworkError(where + ": TLS handshake: " + ec.message());
}

std::unique_ptr<asio::ssl::context> tls_context() {
  try {
    auto ctx = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(asio::ssl::verify_peer);
    return ctx;
  } catch (const boost::system::system_error &e) {
    throw NetworkError(std::string("TLS setup: ") + e.what());
  }
}

} // namespace transport
} // namespace mihomoctl
