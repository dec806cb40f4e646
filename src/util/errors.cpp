#include "buffered_reader/errors.hpp"
#include "buffered_reader/unique_fd.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace blr {

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

std::size_t read_retry(int fd, char* dst, std::size_t n, const char* name) {
  while (true) {
    ssize_t got = ::read(fd, dst, n);
    if (got >= 0) return static_cast<std::size_t>(got);
    if (errno == EINTR) continue;
    throw IoError(errno_message(std::string("read ") + name, errno));
  }
}

}
