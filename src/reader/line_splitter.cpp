#include "buffered_reader/line_splitter.hpp"

#include <cstring>
#include <utility>

namespace blr {

SplitResult split_lines(std::string carry, std::string_view text) {
  SplitResult r;
  r.buffer = std::move(carry);
  r.buffer.append(text.data(), text.size());

  const char* base = r.buffer.data();
  const std::size_t n = r.buffer.size();
  std::size_t start = 0;
  while (start < n) {
    const void* hit = std::memchr(base + start, '\n', n - start);
    if (!hit) break;
    const std::size_t pos = static_cast<const char*>(hit) - base;
    r.spans.emplace_back(start, pos - start);
    start = pos + 1;
  }

  if (r.spans.empty()) {
    // no newline yet: everything is still the partial line
    r.carry = std::move(r.buffer);
    r.buffer.clear();
  } else {
    r.carry.assign(base + start, n - start);
  }
  return r;
}

bool finish_lines(std::string& carry, std::string& last_line) {
  if (carry.empty()) return false;
  last_line = std::move(carry);
  carry.clear();
  return true;
}

}
