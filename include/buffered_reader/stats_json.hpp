#pragma once
#include "buffered_reader/metrics.hpp"

#include <cstdint>
#include <string>

namespace blr {

class StatsJsonWriter {
public:
  // One JSON object: file, mode, lines, bytes, time, lines_per_second,
  // megabytes_per_second, file_size.
  static std::string to_json(const ReaderStats& s, std::uint64_t file_size = 0);
};

// "file: 123 lines, 4.56 MB in 0.12 s (1025 lines/s, 38.00 MB/s) [buffered]"
std::string format_stats_line(const ReaderStats& s);

}
