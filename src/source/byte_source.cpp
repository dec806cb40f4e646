#include "buffered_reader/byte_source.hpp"
#include "buffered_reader/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <utility>

namespace blr {

// read_chunk grows its buffer geometrically from here up to max_bytes, so a
// 128 MiB chunk size does not cost a 128 MiB allocation for a tiny file.
static constexpr std::size_t kFirstAlloc = 64 * 1024;

ByteSource::ByteSource(Impl impl, Compression kind, std::string name)
  : impl_(std::move(impl)), kind_(kind), name_(std::move(name)) {}

ByteSource ByteSource::make(UniqueFd fd, std::string name) {
  const Compression kind = detect_compression(name);
  switch (kind) {
    case Compression::Gzip:
      return ByteSource(GzipSource(std::move(fd), name), kind, name);
    case Compression::Bzip2:
      return ByteSource(Bzip2Source(std::move(fd), name), kind, name);
    case Compression::Xz:
    case Compression::Lzma:
      return ByteSource(XzSource(std::move(fd), name), kind, name);
    case Compression::None:
      break;
  }
  return ByteSource(PlainFileSource(std::move(fd), name), kind, name);
}

ByteSource ByteSource::open(const std::string& path) {
  int fd;
  do { fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC); } while (fd < 0 && errno == EINTR);
  if (fd < 0) throw IoError(errno_message("open " + path, errno));
  return make(UniqueFd(fd), path);
}

ByteSource ByteSource::adopt(int fd, std::string name) {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0) throw IoError(errno_message("adopt " + name, errno));
  UniqueFd owned(fd);
  if ((flags & O_ACCMODE) == O_WRONLY)
    throw InvalidModeError(name + ": descriptor is not open for reading");
  return make(std::move(owned), std::move(name));
}

std::string ByteSource::read_chunk(std::size_t max_bytes) {
  if (closed_) throw ClosedResourceError(name_ + ": byte source is closed");
  if (deferred_) std::rethrow_exception(std::exchange(deferred_, nullptr));

  std::string out;
  std::size_t got = 0;
  try {
    while (got < max_bytes) {
      if (got == out.size())
        out.resize(std::min(max_bytes, std::max(out.size() * 2, kFirstAlloc)));
      std::size_t n = std::visit(
          [&](auto& leaf) { return leaf.read_some(&out[got], out.size() - got); }, impl_);
      if (n == 0) break;
      got += n;
    }
  } catch (const ReaderError&) {
    // keep what was read; the caller gets the failure on its next call
    if (got == 0) throw;
    deferred_ = std::current_exception();
  }
  out.resize(got);
  return out;
}

void ByteSource::close() noexcept {
  if (closed_) return;
  closed_ = true;
  std::visit([](auto& leaf) { leaf.close(); }, impl_);
}

}
