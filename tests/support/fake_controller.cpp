#include "support/fake_controller.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cctype>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include <sys/socket.h>

using namespace std::chrono_literals;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = asio::ip::tcp;
namespace http = mihomoctl::http;

namespace fake {

namespace {

struct Route {
  int status = 200;
  std::string body;
  std::chrono::milliseconds latency{0};
  std::string location;
};

struct StreamSpec {
  std::vector<std::string> frames;
  std::chrono::milliseconds interval{50};
  bool repeat = true;
};

// One accepted connection with its own io_context.
struct Conn {
  asio::io_context io;
  tcp::socket sock{io};
};

std::string lower(std::string s) {
  for (auto &c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

std::string str(beast::string_view sv) { return std::string(sv.data(), sv.size()); }

void respond(tcp::socket &sock, unsigned version, const Route &r) {
  bhttp::response<bhttp::string_body> res{bhttp::int_to_status(static_cast<unsigned>(r.status)), version};
  res.set(bhttp::field::content_type, "application/json");
  if (!r.location.empty()) res.set(bhttp::field::location, r.location);
  res.keep_alive(false);
  res.body() = r.body;
  res.prepare_payload();
  beast::error_code ec;
  bhttp::write(sock, res, ec);
}

} // namespace

struct Controller::Impl {
  asio::io_context io;
  tcp::acceptor acc;
  std::string secret;

  mutable std::mutex mu;
  std::map<std::string, Route> routes;          // "METHOD /path"
  std::map<std::string, StreamSpec> streams;    // "/path"
  std::set<std::string> stalled;                // "/path"
  std::vector<http::Request> seen;
  std::set<int> fds;
  std::vector<std::thread> workers;

  std::atomic<bool> stopping{false};
  std::atomic<unsigned> drop_gen{0};
  std::atomic<int> live{0};
  std::atomic<int> accepted{0};
  std::thread accept_thread;

  explicit Impl(std::string s)
      : acc(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)), secret(std::move(s)) {}

  void accept_loop() {
    while (!stopping.load()) {
      auto conn = std::make_shared<Conn>();
      beast::error_code ec;
      acc.accept(conn->sock, ec);
      if (stopping.load()) break;
      if (ec) continue;
      std::lock_guard<std::mutex> lk(mu);
      fds.insert(conn->sock.native_handle());
      workers.emplace_back([this, conn] { serve(*conn); });
    }
  }

  void serve(Conn &c) {
    const int fd = c.sock.native_handle();
    handle(c);
    {
      std::lock_guard<std::mutex> lk(mu);
      fds.erase(fd);
    }
    beast::error_code ec;
    c.sock.shutdown(tcp::socket::shutdown_both, ec);
    c.sock.close(ec);
  }

  // Sleeps in short steps; false once the controller is stopping.
  bool hold(std::chrono::milliseconds d) {
    const auto until = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < until) {
      if (stopping.load()) return false;
      std::this_thread::sleep_for(5ms);
    }
    return !stopping.load();
  }

  void handle(Conn &c) {
    beast::flat_buffer buffer;
    bhttp::request<bhttp::string_body> msg;
    beast::error_code ec;
    bhttp::read(c.sock, buffer, msg, ec);
    if (ec) return;

    http::Request req;
    req.method = str(msg.method_string());
    req.target = str(msg.target());
    for (auto const &f : msg) req.headers[lower(str(f.name_string()))] = str(f.value());
    req.body = msg.body();
    const auto path = req.target.substr(0, req.target.find('?'));
    bool stall;
    {
      std::lock_guard<std::mutex> lk(mu);
      seen.push_back(req);
      stall = stalled.count(path) > 0;
    }
    if (stall) {
      while (hold(50ms)) {}
      return;
    }

    if (!secret.empty() && req.headers["authorization"] != "Bearer " + secret) {
      respond(c.sock, msg.version(), Route{401, R"({"message":"Unauthorized"})"});
      return;
    }

    if (websocket::is_upgrade(msg)) {
      StreamSpec spec;
      {
        std::lock_guard<std::mutex> lk(mu);
        auto it = streams.find(path);
        if (it == streams.end()) {
          respond(c.sock, msg.version(), Route{404, R"({"message":"Resource not found"})"});
          return;
        }
        spec = it->second;
      }
      websocket::stream<tcp::socket &> ws(c.sock);
      ws.accept(msg, ec);
      if (ec) return;
      ++accepted;
      ++live;
      push(c.io, ws, spec);
      --live;
      return;
    }

    Route r{404, R"({"message":"Resource not found"})"};
    {
      std::lock_guard<std::mutex> lk(mu);
      auto it = routes.find(req.method + " " + path);
      if (it != routes.end()) r = it->second;
    }
    if (r.latency.count() > 0 && !hold(r.latency)) return;
    respond(c.sock, msg.version(), r);
  }

  // Writes frames on a timer while a pending read watches for the client
  // closing. Returns once the client is gone, or drops the connection on
  // drop_streams() and stop().
  void push(asio::io_context &io, websocket::stream<tcp::socket &> &ws, const StreamSpec &spec) {
    const unsigned gen = drop_gen.load();
    bool gone = false;
    bool writing = false;
    beast::flat_buffer in;
    std::string out;

    std::function<void()> read_next = [&] {
      ws.async_read(in, [&](beast::error_code e, std::size_t) {
        if (e) {
          gone = true;
          return;
        }
        in.consume(in.size());
        read_next();
      });
    };
    read_next();

    std::size_t i = 0;
    auto next = std::chrono::steady_clock::now();
    while (!gone && !stopping.load() && drop_gen.load() == gen) {
      const auto now = std::chrono::steady_clock::now();
      if (!writing && now >= next && !spec.frames.empty() && (spec.repeat || i < spec.frames.size())) {
        out = spec.frames[i++ % spec.frames.size()];
        writing = true;
        ws.text(true);
        ws.async_write(asio::buffer(out), [&](beast::error_code e, std::size_t) {
          writing = false;
          if (e) gone = true;
        });
        next = now + spec.interval;
      }
      if (io.stopped()) io.restart();
      io.run_for(5ms);
    }

    beast::error_code ec;
    ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    ws.next_layer().close(ec);
    if (io.stopped()) io.restart();
    io.run();
  }
};

Controller::Controller(std::string secret) : impl_(std::make_unique<Impl>(std::move(secret))) {
  impl_->accept_thread = std::thread([this] { impl_->accept_loop(); });
}

Controller::~Controller() { stop(); }

unsigned short Controller::port() const { return impl_->acc.local_endpoint().port(); }

std::string Controller::url() const { return "http://127.0.0.1:" + std::to_string(port()); }

void Controller::route(const std::string &method, const std::string &path, int status, std::string body,
                       std::chrono::milliseconds latency) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->routes[method + " " + path] = Route{status, std::move(body), latency};
}

void Controller::redirect(const std::string &path, const std::string &location) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->routes["GET " + path] = Route{302, "", std::chrono::milliseconds(0), location};
}

void Controller::stream(const std::string &path, std::vector<std::string> frames,
                        std::chrono::milliseconds interval, bool repeat) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->streams[path] = StreamSpec{std::move(frames), interval, repeat};
}

void Controller::stall(const std::string &path) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->stalled.insert(path);
}

int Controller::live_streams() const { return impl_->live.load(); }

int Controller::accepted_streams() const { return impl_->accepted.load(); }

std::vector<http::Request> Controller::requests() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seen;
}

void Controller::drop_streams() { ++impl_->drop_gen; }

void Controller::stop() {
  if (impl_->stopping.exchange(true)) return;
  ::shutdown(impl_->acc.native_handle(), SHUT_RDWR);
  if (impl_->accept_thread.joinable()) impl_->accept_thread.join();
  beast::error_code ec;
  impl_->acc.close(ec);

  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    for (int fd : impl_->fds) ::shutdown(fd, SHUT_RDWR);
    workers.swap(impl_->workers);
  }
  for (auto &t : workers)
    if (t.joinable()) t.join();
}

} // namespace fake
