#pragma once
#include "buffered_reader/metrics.hpp"
#include "buffered_reader/reader_config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>

namespace blr {

// Forward-only reader over the lines of a plain or compressed text file.
//
//   blr::LineReader r("events.log.gz");
//   for (std::string_view line : r) { ... }
//
// Plain files are read by a background producer thread ("buffered" mode);
// compressed files are decompressed on the caller's thread ("compressed"
// mode). Lines exclude the '\n'; a '\r' before it is kept.
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes    = 0;        // 0 -> default_chunk_bytes(compression)
    std::string encoding       = "utf-8";
    ErrorPolicy errors         = ErrorPolicy::Replace;
    std::size_t queue_capacity = 4;        // chunks in flight (buffered mode)
  };

  explicit LineReader(std::string path);     // uses default Config{}
  LineReader(std::string path, Config cfg);
  // Adopts `fd` (closed by the reader); `name` selects the codec.
  LineReader(int fd, std::string name, Config cfg);

  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Next line; the view stays valid until the next call. False once the
  // source is exhausted (or after an error was raised); never restarts.
  bool read_next(std::string_view& out);

  using LineCallback = std::function<void(std::string_view)>;

  // Feed the remaining lines to `cb`; returns how many were delivered.
  std::uint64_t for_each_line(const LineCallback& cb);

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::string_view*;
    using reference         = const std::string_view&;

    iterator() = default;
    reference operator*() const { return line_; }
    pointer operator->() const { return &line_; }
    iterator& operator++();
    void operator++(int) { ++*this; }
    friend bool operator==(const iterator& a, const iterator& b) { return a.r_ == b.r_; }
    friend bool operator!=(const iterator& a, const iterator& b) { return a.r_ != b.r_; }

  private:
    friend class LineReader;
    explicit iterator(LineReader* r) : r_(r) { ++*this; }
    LineReader* r_{nullptr};
    std::string_view line_;
  };

  iterator begin();
  iterator end() { return iterator(); }

  ReaderStats stats() const;

  // Release the source and join the producer. Safe to call repeatedly.
  void close() noexcept;
  bool closed() const noexcept;

  bool exhausted() const;
  Compression compression() const;
  std::size_t chunk_bytes() const;
  // Largest number of chunks that sat in the producer queue at once
  // (0 in compressed mode).
  std::size_t queue_high_water() const;

private:
  struct Impl; Impl* p_;
};

}
