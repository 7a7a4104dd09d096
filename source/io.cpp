#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mihomoctl {
namespace io {

void ensure_dir(const fs::path &p) {
  std::error_code ec;
  if (fs::is_directory(p, ec))
    return;
  fs::create_directories(p, ec);
  if (ec)
    throw IOError("create directory " + p.string() + ": " + ec.message());
}

void rotate_logs(const fs::path &base_path, std::uintmax_t max_bytes,
                 int backups) {
  std::error_code ec;
  if (!fs::exists(base_path, ec))
    return;
  auto sz = fs::file_size(base_path, ec);
  if (ec || sz < max_bytes)
    return;

  for (int i = backups - 1; i >= 1; --i) {
    fs::path src = base_path;
    src += "." + std::to_string(i);
    fs::path dst = base_path;
    dst += "." + std::to_string(i + 1);
    if (fs::exists(src)) {
      std::error_code e2;
      fs::rename(src, dst, e2);
    }
  }
  fs::path first = base_path;
  first += ".1";
  std::error_code e3;
  fs::rename(base_path, first, e3);
}

static int open_append(const fs::path &path) {
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
    throw IOError("open " + path.string() + ": " + std::strerror(errno));
  return fd;
}

int open_for_stdout(const fs::path &path) { return open_append(path); }
int open_for_stderr(const fs::path &path) { return open_append(path); }

fs::path temp_sibling(const fs::path &target) {
  static std::atomic<unsigned long> seq{0};
  auto name = "." + target.filename().string() + "." +
              std::to_string(::getpid()) + "." + std::to_string(++seq);
  return target.parent_path() / name;
}

void fsync_dir(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0)
    return;
  (void)::fsync(fd);
  ::close(fd);
}

void atomic_write(const fs::path &target, const std::string &data,
                  unsigned mode) {
  ensure_dir(target.parent_path());
  const auto tmp = temp_sibling(target);

  int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0)
    throw IOError("open " + tmp.string() + ": " + std::strerror(errno));

  const char *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      throw IOError("write " + tmp.string() + ": " + std::strerror(err));
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  const char *step = ::fchmod(fd, static_cast<mode_t>(mode)) != 0 ? "chmod"
                     : ::fsync(fd) != 0                              ? "fsync"
                                                                     : nullptr;
  if (step) {
    int err = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    throw IOError(std::string(step) + " " + tmp.string() + ": " + std::strerror(err));
  }
  ::close(fd);

  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    int err = errno;
    ::unlink(tmp.c_str());
    throw IOError("rename " + tmp.string() + " -> " + target.string() + ": " +
                  std::strerror(err));
  }
  fsync_dir(target.parent_path());
}

std::optional<std::string> read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace io
} // namespace mihomoctl
