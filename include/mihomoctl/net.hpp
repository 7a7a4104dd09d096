#pragma once
#include <string>

namespace mihomoctl {

struct Url {
  std::string scheme; // http, https, ws, wss
  std::string host;
  std::string port;
  std::string target = "/"; // path + query

  // NetworkError on anything that is not scheme://host[:port][/target].
  static Url parse(const std::string &s);

  bool tls() const { return scheme == "https" || scheme == "wss"; }
  // host[:port] as sent in the Host header
  std::string authority() const;
  std::string str() const;
  // Resolves a Location header value against this URL.
  Url resolve(const std::string &location) const;
};

std::string percent_encode(const std::string &s);

} // namespace mihomoctl
