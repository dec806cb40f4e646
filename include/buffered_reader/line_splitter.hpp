#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blr {

// Complete lines found in `carry + text`, plus the unsplit tail.
// Lines are kept as (offset, length) spans into `buffer` so the result can
// be moved around without invalidating anything.
struct SplitResult {
  std::string buffer;
  std::vector<std::pair<std::size_t, std::size_t>> spans;
  std::string carry;

  std::size_t size() const noexcept { return spans.size(); }
  std::string_view line(std::size_t i) const {
    return std::string_view(buffer.data() + spans[i].first, spans[i].second);
  }
};

// Split `carry + text` on '\n'. Every piece but the last is a complete line
// (newline dropped, '\r' kept); the last piece becomes the new carry even
// when it is empty. With no newline at all the carry simply grows.
SplitResult split_lines(std::string carry, std::string_view text);

// End of stream: the carry is a final line only if it holds anything, so a
// source ending in '\n' produces no trailing blank line.
bool finish_lines(std::string& carry, std::string& last_line);

}
