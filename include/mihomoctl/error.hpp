#pragma once
#include <stdexcept>
#include <string>

namespace mihomoctl {

enum class ErrorKind { Network, NotFound, Conflict, Validation, Auth, Process, IO };

const char *kind_name(ErrorKind k);

// Base of every error the library throws. The kind survives wrapping so
// callers can always branch on it.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

  // Rethrows `e` with `context` prepended, keeping the concrete kind.
  [[noreturn]] static void wrap(const Error &e, const std::string &context);

private:
  ErrorKind kind_;
};

class NetworkError : public Error {
public:
  explicit NetworkError(const std::string &msg) : Error(ErrorKind::Network, msg) {}
};

class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string &msg) : Error(ErrorKind::NotFound, msg) {}
};

class ConflictError : public Error {
public:
  explicit ConflictError(const std::string &msg) : Error(ErrorKind::Conflict, msg) {}
};

class ValidationError : public Error {
public:
  explicit ValidationError(const std::string &msg)
      : Error(ErrorKind::Validation, msg) {}
};

class AuthError : public Error {
public:
  explicit AuthError(const std::string &msg) : Error(ErrorKind::Auth, msg) {}
};

class ProcessError : public Error {
public:
  explicit ProcessError(const std::string &msg) : Error(ErrorKind::Process, msg) {}
};

class IOError : public Error {
public:
  explicit IOError(const std::string &msg) : Error(ErrorKind::IO, msg) {}
};

[[noreturn]] void throw_error(ErrorKind kind, const std::string &msg);

} // namespace mihomoctl
