#include <mihomoctl/error.hpp>
#include <mihomoctl/websocket.hpp>

#include "transport.hpp"

#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>

using namespace std::chrono;

namespace mihomoctl {
namespace ws {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

static constexpr std::size_t kMaxMessage = 16 * 1024 * 1024;

class Session {
public:
  explicit Session(std::string where, std::unique_ptr<asio::ssl::context> tls = nullptr)
      : where_(std::move(where)), tls_(std::move(tls)) {}
  virtual ~Session() = default;

  virtual void connect(const Url &url, const http::Headers &headers, const transport::Budget &budget) = 0;
  virtual std::optional<std::string> read_message(milliseconds poll) = 0;
  virtual void close() = 0;

protected:
  asio::io_context io_;
  std::string where_;
  std::unique_ptr<asio::ssl::context> tls_;
};

template <class Next>
class StreamSession final : public Session {
public:
  explicit StreamSession(std::string where) : Session(std::move(where)), ws_(io_) {}
  StreamSession(std::string where, std::unique_ptr<asio::ssl::context> tls)
      : Session(std::move(where), std::move(tls)), ws_(io_, *tls_) {}

  ~StreamSession() override { close(); }

  void connect(const Url &url, const http::Headers &headers, const transport::Budget &budget) override {
    transport::open(io_, ws_.next_layer(), url, budget);

    ws_.read_message_max(kMaxMessage);
    ws_.set_option(websocket::stream_base::decorator([headers](websocket::request_type &req) {
      for (auto &kv : headers) req.set(kv.first, kv.second);
    }));

    const std::string host = url.authority();
    websocket::response_type res;
    beast::error_code ec;
    ws_.async_handshake(res, host, url.target, [&](beast::error_code e) { ec = e; });
    transport::await(io_, budget, [this] { beast::get_lowest_layer(ws_).cancel(); },
                     where_ + ": handshake");
    if (!ec) return;

    const auto status = res.result_int();
    if (status == 401 || status == 403)
      throw AuthError(where_ + ": HTTP " + std::to_string(status));
    if (status == 404) throw NotFoundError(where_ + ": HTTP 404");
    if (ec == websocket::error::upgrade_declined)
      throw NetworkError(where_ + ": unexpected HTTP " + std::to_string(status));
    throw NetworkError(where_ + ": handshake: " + ec.message());
  }

  std::optional<std::string> read_message(milliseconds poll) override {
    if (closed_) throw NetworkError(where_ + ": connection closed");
    if (!reading_) {
      reading_ = true;
      done_ = false;
      ws_.async_read(buffer_, [this](beast::error_code e, std::size_t) {
        read_ec_ = e;
        done_ = true;
      });
    }
    transport::run_until(io_, transport::Clock::now() + poll, poll, {});
    if (!done_) return std::nullopt;

    reading_ = false;
    if (read_ec_ == websocket::error::closed) throw NetworkError(where_ + ": closed by peer");
    if (read_ec_) throw NetworkError(where_ + ": read: " + read_ec_.message());
    std::string msg = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    return msg;
  }

  void close() override {
    if (closed_) return;
    closed_ = true;
    if (ws_.is_open()) {
      ws_.async_close(websocket::close_code::normal, [this](beast::error_code e) {
        if (e) spdlog::debug("[ws] {}: close: {}", where_, e.message());
      });
      transport::run_until(io_, transport::Clock::now() + milliseconds(200), milliseconds(50), {});
    }
    auto &lowest = beast::get_lowest_layer(ws_);
    beast::error_code ec;
    lowest.socket().shutdown(transport::tcp::socket::shutdown_both, ec);
    lowest.close();
    if (io_.stopped()) io_.restart();
    io_.run();
  }

private:
  websocket::stream<Next> ws_;
  beast::flat_buffer buffer_;
  beast::error_code read_ec_;
  bool reading_ = false;
  bool done_ = false;
  bool closed_ = false;
};

Client::Client(const Url &url, const http::Headers &headers, milliseconds timeout, milliseconds poll,
               std::function<bool()> cancelled) {
  const std::string where = "websocket " + url.target;
  if (url.tls())
    session_ = std::make_unique<StreamSession<transport::TlsStream>>(where, transport::tls_context());
  else
    session_ = std::make_unique<StreamSession<transport::PlainStream>>(where);

  transport::Budget budget{transport::Clock::now() + timeout, poll, std::move(cancelled)};
  session_->connect(url, headers, budget);
}

Client::~Client() = default;

std::optional<std::string> Client::read_message(milliseconds poll) {
  return session_->read_message(poll);
}

void Client::close() { session_->close(); }

} // namespace ws
} // namespace mihomoctl
