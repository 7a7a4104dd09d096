#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/process.hpp>

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace mihomoctl {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static int exit_code(int status) {
  return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

int ProcessRunner::spawn(const SpawnSpec &spec) {
  io::ensure_dir(spec.logs_dir);
  const auto outp = spec.logs_dir / "mihomo.out";
  const auto errp = spec.logs_dir / "mihomo.err";
  io::rotate_logs(outp, spec.log_max_bytes, 3);
  io::rotate_logs(errp, spec.log_max_bytes, 3);

  int outfd = io::open_for_stdout(outp);
  int errfd = -1;
  try {
    errfd = io::open_for_stderr(errp);
  } catch (const IOError &) {
    ::close(outfd);
    throw;
  }

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) {
    int err = errno;
    ::close(outfd); ::close(errfd);
    throw ProcessError(std::string("pipe: ") + std::strerror(err));
  }

  const std::string bin = spec.binary.string();
  const std::string dir = spec.config.parent_path().string();
  const std::string cfg = spec.config.string();
  std::vector<char *> argv = {const_cast<char *>(bin.c_str()), const_cast<char *>("-d"),
                              const_cast<char *>(dir.c_str()), const_cast<char *>("-f"),
                              const_cast<char *>(cfg.c_str()), nullptr};

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(outfd); ::close(errfd);
    ::close(pfd[0]); ::close(pfd[1]);
    throw ProcessError(std::string("fork: ") + std::strerror(err));
  }

  if (pid == 0) {
    ::close(pfd[0]);
    ::setsid();
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(outfd, STDOUT_FILENO);
    ::dup2(errfd, STDERR_FILENO);
    ::close(outfd); ::close(errfd);
    if (!dir.empty()) (void)!::chdir(dir.c_str());

    ::execv(argv[0], argv.data());

    int err = errno;
    (void)!::write(pfd[1], &err, sizeof(err));
    ::close(pfd[1]);
    _exit(127);
  }

  ::close(outfd); ::close(errfd);
  ::close(pfd[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(pfd[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(pfd[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    throw ProcessError("exec " + bin + ": " + std::strerror(child_errno));
  }
  spdlog::debug("[service] spawned pid={} {}", pid, bin);
  return pid;
}

std::optional<int> ProcessRunner::reap(int pid) {
  if (pid <= 0) return std::nullopt;
  int status = 0;
  pid_t r = ::waitpid(pid, &status, WNOHANG);
  if (r == pid) return exit_code(status);
  return std::nullopt;
}

static bool is_zombie(int pid) {
  auto stat = io::read_file(fs::path("/proc") / std::to_string(pid) / "stat");
  if (!stat) return false;
  auto rp = stat->rfind(')');
  return rp != std::string::npos && rp + 2 < stat->size() && (*stat)[rp + 2] == 'Z';
}

bool ProcessRunner::alive(int pid) {
  if (pid <= 0) return false;
  if (reap(pid)) return false;
  if (!(::kill(pid, 0) == 0 || errno == EPERM)) return false;
  return !is_zombie(pid);
}

static fs::path canonical_or(const fs::path &p) {
  std::error_code ec;
  auto c = fs::weakly_canonical(p, ec);
  return ec ? p : c;
}

bool ProcessRunner::owned(int pid, const fs::path &binary) {
  if (!alive(pid)) return false;
  if (binary.empty()) return true;

  const fs::path proc = fs::path("/proc") / std::to_string(pid);
  const auto want = canonical_or(binary);
  bool evidence = false;

  std::error_code ec;
  auto exe = fs::read_symlink(proc / "exe", ec);
  if (!ec) {
    evidence = true;
    if (exe == want) return true;
  }

  // Interpreted binaries show the interpreter as exe; the script path is
  // then argv[1].
  if (auto cmd = io::read_file(proc / "cmdline"); cmd && !cmd->empty()) {
    evidence = true;
    std::vector<std::string> args;
    std::string cur;
    for (char c : *cmd) {
      if (c == '\0') { args.push_back(cur); cur.clear(); }
      else cur.push_back(c);
    }
    if (!cur.empty()) args.push_back(cur);
    for (size_t i = 0; i < args.size() && i < 2; ++i)
      if (canonical_or(args[i]) == want) return true;
  }
  return !evidence;
}

static bool wait_gone(int pid, milliseconds limit) {
  const auto deadline = steady_clock::now() + limit;
  while (steady_clock::now() < deadline) {
    if (!ProcessRunner::alive(pid)) return true;
    std::this_thread::sleep_for(milliseconds(50));
  }
  return !ProcessRunner::alive(pid);
}

bool ProcessRunner::terminate(int pid, milliseconds grace, milliseconds kill_wait) {
  if (!alive(pid)) return true;
  spdlog::info("[service] stopping pid={} (SIGTERM, timeout={}ms)", pid, grace.count());
  ::kill(pid, SIGTERM);
  if (wait_gone(pid, grace)) return true;

  spdlog::warn("[service] force kill pid={}", pid);
  ::kill(pid, SIGKILL);
  return wait_gone(pid, kill_wait);
}

} // namespace mihomoctl
