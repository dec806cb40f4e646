#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace blr {

// Snapshot handed to whoever reports on a reader.
struct ReaderStats {
  std::string file;                  // basename, or "<stream>"
  std::string mode;                  // "buffered" | "compressed"
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  double seconds = 0.0;
  double lines_per_second = 0.0;
  double megabytes_per_second = 0.0;
};

// Consumer-side counters of one reader. Rates are derived in snapshot(),
// never cached.
class ReaderCounters {
public:
  using clock = std::chrono::steady_clock;

  void reset();
  void add_line() noexcept { ++lines_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  // First call wins; later calls keep the original start.
  void mark_start();
  // Freeze the clock (end of stream, error or close).
  void mark_finish();

  bool started() const noexcept { return started_; }
  bool finished() const noexcept { return finished_; }
  std::uint64_t lines() const noexcept { return lines_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

  // Seconds since start, up to now or to the frozen finish.
  double elapsed_seconds() const;

  ReaderStats snapshot(std::string file, std::string mode) const;

private:
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  clock::time_point start_{};
  clock::time_point finish_{};
  bool started_{false};
  bool finished_{false};
};

}
