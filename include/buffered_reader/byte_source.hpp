#pragma once
#include "buffered_reader/reader_config.hpp"
#include "buffered_reader/unique_fd.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <variant>

namespace blr {

// Leaves of ByteSource. Each one owns its descriptor (and codec state) and
// exposes the same two calls:
//   read_some(dst, n) -> 1..n bytes, or 0 at end of stream
//   close()           -> release everything; safe to repeat
// Codec leaves hand out whatever they decoded before hitting corrupt input
// and raise the DecodeError on the following call.

class PlainFileSource {
public:
  PlainFileSource(UniqueFd fd, std::string name);
  std::size_t read_some(char* dst, std::size_t n);
  void close() noexcept { fd_.reset(); }

private:
  UniqueFd fd_;
  std::string name_;
};

class GzipSource {
public:
  GzipSource(UniqueFd fd, std::string name);
  GzipSource(GzipSource&&) noexcept;
  GzipSource& operator=(GzipSource&&) noexcept;
  ~GzipSource();
  std::size_t read_some(char* dst, std::size_t n);
  void close() noexcept;

private:
  struct State;
  std::unique_ptr<State> st_;
};

class Bzip2Source {
public:
  Bzip2Source(UniqueFd fd, std::string name);
  Bzip2Source(Bzip2Source&&) noexcept;
  Bzip2Source& operator=(Bzip2Source&&) noexcept;
  ~Bzip2Source();
  std::size_t read_some(char* dst, std::size_t n);
  void close() noexcept;

private:
  struct State;
  std::unique_ptr<State> st_;
};

// .xz and legacy .lzma (LZMA-alone) both go through liblzma's auto decoder.
class XzSource {
public:
  XzSource(UniqueFd fd, std::string name);
  XzSource(XzSource&&) noexcept;
  XzSource& operator=(XzSource&&) noexcept;
  ~XzSource();
  std::size_t read_some(char* dst, std::size_t n);
  void close() noexcept;

private:
  struct State;
  std::unique_ptr<State> st_;
};

// Uniform pull interface over raw or decompressed bytes. The variant is
// picked once, at open time, from the file name.
class ByteSource {
public:
  // Open `path` read-only. IoError if it cannot be opened.
  static ByteSource open(const std::string& path);

  // Take ownership of an already-open descriptor positioned at offset 0.
  // `name` drives compression sniffing and error messages. Throws
  // InvalidModeError if `fd` is not readable, IoError if it is not open.
  static ByteSource adopt(int fd, std::string name);

  ByteSource(ByteSource&&) noexcept = default;
  ByteSource& operator=(ByteSource&&) noexcept = default;
  ~ByteSource() = default;

  // Up to `max_bytes` bytes; fewer only at end of stream, empty at the end.
  std::string read_chunk(std::size_t max_bytes);

  void close() noexcept;

  Compression compression() const noexcept { return kind_; }
  const std::string& name() const noexcept { return name_; }

private:
  using Impl = std::variant<PlainFileSource, GzipSource, Bzip2Source, XzSource>;

  ByteSource(Impl impl, Compression kind, std::string name);
  static ByteSource make(UniqueFd fd, std::string name);

  Impl impl_;
  Compression kind_;
  std::string name_;
  std::exception_ptr deferred_;
  bool closed_{false};
};

}
