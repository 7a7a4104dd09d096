#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/pointer.hpp>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mihomoctl {

bool valid_key(const std::string &key) {
  if (key.empty() || key.size() > 128 || key.front() == '.')
    return false;
  for (char c : key) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-'))
      return false;
  }
  return true;
}

std::optional<std::string> AtomicPointer::read() const {
  auto content = io::read_file(file_);
  if (!content)
    return std::nullopt;
  auto &s = *content;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  if (s.empty())
    return std::nullopt;
  if (!valid_key(s))
    throw IOError("corrupt pointer file " + file_.string());
  return s;
}

void AtomicPointer::write(const std::string &key) const {
  if (!valid_key(key))
    throw ValidationError("invalid name '" + key + "'");
  io::atomic_write(file_, key + "\n");
}

void AtomicPointer::clear() const {
  if (::unlink(file_.c_str()) != 0 && errno != ENOENT)
    throw IOError("remove " + file_.string() + ": " + std::strerror(errno));
}

} // namespace mihomoctl
