#include <mihomoctl/error.hpp>
#include <mihomoctl/http.hpp>

#include "transport.hpp"

#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>

using namespace std::chrono;

namespace mihomoctl {
namespace http {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

static constexpr std::uint32_t kMaxHead = 64 * 1024;
static constexpr std::uint64_t kMaxBody = 512ull * 1024 * 1024;

static std::string lower(std::string s) {
  for (auto &c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

static std::string str(beast::string_view sv) { return std::string(sv.data(), sv.size()); }

std::string Response::header(const std::string &name) const {
  auto it = headers.find(lower(name));
  return it == headers.end() ? std::string{} : it->second;
}

std::string reason_phrase(int code) {
  return str(bhttp::obsolete_reason(bhttp::int_to_status(static_cast<unsigned>(code))));
}

template <class Body>
static Response head_of(const bhttp::response<Body> &m) {
  Response r;
  r.status = static_cast<int>(m.result_int());
  r.reason = str(m.reason());
  for (auto const &f : m) r.headers[lower(str(f.name_string()))] = str(f.value());
  return r;
}

static Response to_response(bhttp::response<bhttp::string_body> &m) {
  Response r = head_of(m);
  r.body = std::move(m.body());
  return r;
}

static Response to_response(bhttp::response<bhttp::file_body> &m) { return head_of(m); }

template <class Stream, class Body>
static void exchange(asio::io_context &io, Stream &stream, const Url &url, const Request &req,
                     bhttp::response_parser<Body> &parser, const transport::Budget &budget) {
  const auto verb = bhttp::string_to_verb(req.method);
  if (verb == bhttp::verb::unknown) throw NetworkError("unsupported HTTP method " + req.method);
  const std::string where = req.method + " " + url.authority() + req.target;

  bhttp::request<bhttp::string_body> msg{verb, req.target, 11};
  msg.set(bhttp::field::host, url.authority());
  for (auto &kv : req.headers) msg.set(kv.first, kv.second);
  msg.set(bhttp::field::connection, "close");
  msg.body() = req.body;
  msg.prepare_payload();

  auto abort = [&] { beast::get_lowest_layer(stream).cancel(); };
  beast::error_code ec;
  bhttp::async_write(stream, msg, [&](beast::error_code e, std::size_t) { ec = e; });
  transport::await(io, budget, abort, where);
  if (ec) throw NetworkError(where + ": write: " + ec.message());

  if (verb == bhttp::verb::head) parser.skip(true);
  beast::flat_buffer buffer;
  bhttp::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
  transport::await(io, budget, abort, where);
  if (ec && !parser.is_done()) throw NetworkError(where + ": read: " + ec.message());
}

// Runs one request; `prepare` gets the parser before reading starts.
template <class Body, class Prepare>
static Response perform(const Url &url, const Request &req, milliseconds timeout, Prepare &&prepare) {
  asio::io_context io;
  const auto budget = transport::Budget::within(timeout);
  bhttp::response_parser<Body> parser;
  parser.header_limit(kMaxHead);
  parser.body_limit(kMaxBody);
  prepare(parser);

  if (url.tls()) {
    auto ctx = transport::tls_context();
    transport::TlsStream stream(io, *ctx);
    transport::open(io, stream, url, budget);
    exchange(io, stream, url, req, parser, budget);
  } else {
    transport::PlainStream stream(io);
    transport::open(io, stream, url, budget);
    exchange(io, stream, url, req, parser, budget);
  }
  return to_response(parser.get());
}

Response send(const Url &url, const Request &req, milliseconds timeout) {
  return perform<bhttp::string_body>(url, req, timeout, [](bhttp::response_parser<bhttp::string_body> &) {});
}

static bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

template <class Fetch>
static Response follow(const std::string &url, const Headers &headers, int max_redirects, Fetch &&fetch) {
  Url u = Url::parse(url);
  for (int hop = 0;; ++hop) {
    Request req;
    req.target = u.target;
    req.headers = headers;
    Response r = fetch(u, req);
    if (!is_redirect(r.status)) return r;
    auto loc = r.header("location");
    if (loc.empty()) return r;
    if (hop >= max_redirects) throw NetworkError("too many redirects for " + url);
    u = u.resolve(loc);
    spdlog::debug("[http] redirect -> {}", u.str());
  }
}

Response get(const std::string &url, const Headers &headers, milliseconds timeout,
             int max_redirects) {
  return follow(url, headers, max_redirects,
                [&](const Url &u, const Request &req) { return send(u, req, timeout); });
}

Response download(const std::string &url, const Headers &headers, const std::filesystem::path &dest,
                  milliseconds timeout, int max_redirects) {
  return follow(url, headers, max_redirects, [&](const Url &u, const Request &req) {
    return perform<bhttp::file_body>(u, req, timeout, [&](bhttp::response_parser<bhttp::file_body> &p) {
      beast::error_code ec;
      p.get().body().open(dest.c_str(), beast::file_mode::write, ec);
      if (ec) throw IOError("cannot open " + dest.string() + ": " + ec.message());
    });
  });
}

} // namespace http
} // namespace mihomoctl
