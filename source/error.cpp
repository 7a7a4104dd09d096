#include <mihomoctl/error.hpp>

namespace mihomoctl {

const char *kind_name(ErrorKind k) {
  switch (k) {
  case ErrorKind::Network:
    return "network";
  case ErrorKind::NotFound:
    return "not-found";
  case ErrorKind::Conflict:
    return "conflict";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Auth:
    return "auth";
  case ErrorKind::Process:
    return "process";
  case ErrorKind::IO:
    return "io";
  }
  return "unknown";
}

void throw_error(ErrorKind kind, const std::string &msg) {
  switch (kind) {
  case ErrorKind::Network:
    throw NetworkError(msg);
  case ErrorKind::NotFound:
    throw NotFoundError(msg);
  case ErrorKind::Conflict:
    throw ConflictError(msg);
  case ErrorKind::Validation:
    throw ValidationError(msg);
  case ErrorKind::Auth:
    throw AuthError(msg);
  case ErrorKind::Process:
    throw ProcessError(msg);
  case ErrorKind::IO:
    throw IOError(msg);
  }
  throw Error(kind, msg);
}

void Error::wrap(const Error &e, const std::string &context) {
  throw_error(e.kind(), context + ": " + e.what());
}

} // namespace mihomoctl
