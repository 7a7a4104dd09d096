#pragma once
#include "http.hpp"
#include "net.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mihomoctl {
namespace ws {

class Session;

class Client {
public:
  // Connects and performs the upgrade. AuthError on 401/403, NotFoundError
  // on 404, NetworkError for everything else. The wait runs in `poll`
  // slices; once `cancelled` returns true the attempt is abandoned with
  // NetworkError.
  Client(const Url &url, const http::Headers &headers, std::chrono::milliseconds timeout,
         std::chrono::milliseconds poll = std::chrono::milliseconds(200),
         std::function<bool()> cancelled = {});
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  // Next complete data message, or nullopt when nothing arrived within
  // `poll`. A read still in flight carries over to the next call.
  // NetworkError once the peer closes or the connection breaks.
  std::optional<std::string> read_message(std::chrono::milliseconds poll);

  void close();

private:
  std::unique_ptr<Session> session_;
};

} // namespace ws
} // namespace mihomoctl
