#pragma once
#include <mihomoctl/net.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mihomoctl {
namespace transport {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;
using Clock = std::chrono::steady_clock;

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

// Limits for one blocking exchange. The io_context runs in `poll` slices up
// to `deadline`, and `cancelled` is checked between slices.
struct Budget {
  Clock::time_point deadline;
  std::chrono::milliseconds poll{200};
  std::function<bool()> cancelled;

  static Budget within(std::chrono::milliseconds timeout) {
    return Budget{Clock::now() + timeout, std::chrono::milliseconds(200), {}};
  }
};

enum class Wait { Done, Expired, Cancelled };

// Runs handlers until none is left (Done), `until` passes or `cancelled`
// returns true. Pending operations are left untouched.
Wait run_until(asio::io_context &io, Clock::time_point until, std::chrono::milliseconds poll,
               const std::function<bool()> &cancelled);

// Waits for the operation the caller just started. On deadline or
// cancellation `abort` is called, its handler drained, and NetworkError
// thrown as "<what> timed out" or "<what> cancelled".
void await(asio::io_context &io, const Budget &budget, const std::function<void()> &abort,
           const std::string &what);

void open(asio::io_context &io, PlainStream &stream, const Url &url, const Budget &budget);
void open(asio::io_context &io, TlsStream &stream, const Url &url, const Budget &budget);

// Client context verifying peers against the system trust store.
std::unique_ptr<asio::ssl::context> tls_context();

} // namespace transport
} // namespace mihomoctl
