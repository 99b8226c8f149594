#include <devloop/process.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devloop {

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

static void close_pair(int fds[2]) {
  ::close(fds[0]);
  ::close(fds[1]);
}

static std::vector<char *> to_argv(const std::vector<std::string> &args) {
  std::vector<char *> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args)
    argv_c.push_back(const_cast<char *>(s.c_str()));
  argv_c.push_back(nullptr);
  return argv_c;
}

static int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    close_pair(out_pipe);
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close_pair(out_pipe);
    close_pair(err_pipe);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    auto argv_c = to_argv(args);
    ::execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  // Drain both pipes together so a full stderr cannot stall the child.
  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  std::string *sinks[2] = {&res.out, &res.err};
  int open = 2;
  std::array<char, 4096> buf{};
  while (open > 0) {
    int pr = ::poll(fds, 2, -1);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open;
      }
    }
  }
  for (auto &f : fds)
    if (f.fd >= 0)
      ::close(f.fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      res.exit_code = -1;
      return res;
    }
  }
  res.exit_code = decode_status(status);
  return res;
}

namespace {

// Splits the byte stream into lines; a trailing partial line is kept until
// more data (or EOF) arrives.
class LineSplitter {
public:
  explicit LineSplitter(const LineSink &sink) : sink_(sink) {}

  void feed(const char *data, size_t n) {
    buf_.append(data, n);
    size_t start = 0;
    for (;;) {
      auto nl = buf_.find('\n', start);
      if (nl == std::string::npos)
        break;
      emit(std::string_view(buf_).substr(start, nl - start));
      start = nl + 1;
    }
    buf_.erase(0, start);
  }

  void finish() {
    if (!buf_.empty()) {
      emit(buf_);
      buf_.clear();
    }
  }

private:
  void emit(std::string_view line) {
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (sink_)
      sink_(line);
  }

  const LineSink &sink_;
  std::string buf_;
};

// false once the write end is closed or broken.
bool drain(int fd, LineSplitter &lines) {
  std::array<char, 4096> buf{};
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
      lines.feed(buf.data(), static_cast<size_t>(n));
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

StreamResult run_streaming(const std::vector<std::string> &args,
                           const std::filesystem::path &cwd,
                           const LineSink &on_line,
                           const std::atomic_bool &stop) {
  StreamResult res{};
  if (args.empty())
    return res;

  int out_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exec_errno = errno;
    return res;
  }
  // Reports the child's errno when exec fails; closed by a successful exec.
  int exec_pipe[2];
  if (safe_pipe(exec_pipe) != 0) {
    res.exec_errno = errno;
    close_pair(out_pipe);
    return res;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    res.exec_errno = errno;
    close_pair(out_pipe);
    close_pair(exec_pipe);
    return res;
  }

  if (pid == 0) {
    ::close(exec_pipe[0]);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      int err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(126);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);

    auto argv_c = to_argv(args);
    ::execvp(argv_c[0], argv_c.data());

    int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);

  if (n > 0) {
    ::close(out_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    res.exec_errno = child_errno;
    res.exit_code = decode_status(status);
    return res;
  }

  res.launched = true;
  int fd = out_pipe[0];
  ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);

  LineSplitter lines(on_line);
  bool open = true;
  bool exited = false;
  int status = 0;

  while (open || !exited) {
    if (open) {
      pollfd p{fd, POLLIN, 0};
      (void)::poll(&p, 1, 100);
      open = drain(fd, lines);
    } else {
      ::usleep(50 * 1000);
    }

    if (!exited) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid)
        exited = true;
    }

    if (exited && !open)
      break;

    if (stop.load()) {
      res.interrupted = true;
      break;
    }
  }

  lines.finish();
  ::close(fd);

  if (exited)
    res.exit_code = decode_status(status);
  return res;
}

} // namespace devloop
