#pragma once
#include "net.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace mihomoctl {
namespace http {

using Headers = std::map<std::string, std::string>;

struct Request {
  std::string method = "GET";
  std::string target = "/";
  Headers headers;
  std::string body;
};

struct Response {
  int status = 0;
  std::string reason;
  Headers headers; // names lower-cased
  std::string body;

  std::string header(const std::string &name) const;
};

std::string reason_phrase(int code);

// One request on a fresh connection ("Connection: close"). The body is
// buffered in full.
Response send(const Url &url, const Request &req, std::chrono::milliseconds timeout);

// GET following up to `max_redirects` redirects.
Response get(const std::string &url, const Headers &headers,
             std::chrono::milliseconds timeout, int max_redirects = 5);

// GET streaming the final body into `dest` (created or truncated). The
// returned Response has an empty body; on a non-2xx status `dest` holds
// whatever the server sent.
Response download(const std::string &url, const Headers &headers,
                  const std::filesystem::path &dest, std::chrono::milliseconds timeout,
                  int max_redirects = 5);

} // namespace http
} // namespace mihomoctl
