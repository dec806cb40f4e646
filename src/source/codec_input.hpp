#pragma once
#include "buffered_reader/errors.hpp"
#include "buffered_reader/unique_fd.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace blr {
namespace detail {

// Compressed-side input shared by the codec leaves: the descriptor, a
// refill buffer and the sticky failure message.
struct CodecInput {
  static constexpr std::size_t kBufBytes = 256 * 1024;

  UniqueFd fd;
  std::string name;
  std::vector<unsigned char> buf;
  bool eof{false};
  bool done{false};       // decoder reached a clean end of data
  std::string failure;    // set once the stream is known to be bad

  CodecInput(UniqueFd f, std::string n)
    : fd(std::move(f)), name(std::move(n)), buf(kBufBytes) {}

  // Read the next block of compressed bytes; 0 marks end of file.
  std::size_t fill() {
    if (eof || !fd.valid()) { eof = true; return 0; }
    std::size_t n = read_retry(fd.get(), reinterpret_cast<char*>(buf.data()),
                               buf.size(), name.c_str());
    if (n == 0) eof = true;
    return n;
  }

  // Record a decode failure. With output already produced in this call the
  // bytes are returned and the error waits for the next call.
  std::size_t fail(std::string why, std::size_t produced) {
    failure = name + ": " + std::move(why);
    if (produced > 0) return produced;
    throw DecodeError(failure);
  }

  void check() const {
    if (!failure.empty()) throw DecodeError(failure);
  }
};

}
}
