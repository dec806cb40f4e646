#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace blr {

class LineReader;

// Timing decorator around LineReader::read_next. The reader knows nothing
// about it; wrap a reader, pull through the profiler, read the totals.
class PullProfiler {
public:
  // Called after every pull with (call index, microseconds, got a line).
  using TraceSink = std::function<void(std::uint64_t, double, bool)>;

  explicit PullProfiler(LineReader& r, TraceSink trace = {});

  bool read_next(std::string_view& out);

  std::uint64_t calls() const noexcept { return calls_; }
  double total_ms() const noexcept { return total_us_ / 1000.0; }
  double slowest_ms() const noexcept { return slowest_us_ / 1000.0; }
  double mean_us() const noexcept { return calls_ ? total_us_ / calls_ : 0.0; }

  // "[debug] read_next: calls=.. total=..ms mean=..us slowest=..ms"
  std::string summary() const;

private:
  LineReader& r_;
  TraceSink trace_;
  std::uint64_t calls_{0};
  double total_us_{0.0};
  double slowest_us_{0.0};
};

}
