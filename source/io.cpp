#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <devloop/io.hpp>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace devloop {
namespace io {

void ensure_dir(const fs::path &p) {
  if (!fs::exists(p))
    fs::create_directories(p);
}

static int open_append(const fs::path &path) {
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::runtime_error("open: " + path.string() + ": " +
                             std::strerror(errno));
  return fd;
}

void append_line(const fs::path &path, std::string_view line) {
  std::string data(line);
  data.push_back('\n');

  int fd = open_append(path);
  const char *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int e = errno;
      ::close(fd);
      throw std::runtime_error("write: " + path.string() + ": " +
                               std::strerror(e));
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    int e = errno;
    ::close(fd);
    throw std::runtime_error("fsync: " + path.string() + ": " +
                             std::strerror(e));
  }
  ::close(fd);
}

std::size_t count_lines(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return 0;
  std::size_t n = 0;
  char buf[4096];
  while (in) {
    in.read(buf, sizeof(buf));
    auto got = in.gcount();
    for (std::streamsize i = 0; i < got; ++i)
      if (buf[i] == '\n')
        ++n;
  }
  return n;
}

} // namespace io
} // namespace devloop
