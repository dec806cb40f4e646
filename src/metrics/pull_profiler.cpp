#include "buffered_reader/pull_profiler.hpp"
#include "buffered_reader/line_reader.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

namespace blr {

PullProfiler::PullProfiler(LineReader& r, TraceSink trace)
  : r_(r), trace_(std::move(trace)) {}

bool PullProfiler::read_next(std::string_view& out) {
  using clk = std::chrono::steady_clock;
  const auto t0 = clk::now();
  auto record = [&] {
    const double us = std::chrono::duration<double, std::micro>(clk::now() - t0).count();
    ++calls_;
    total_us_ += us;
    slowest_us_ = std::max(slowest_us_, us);
    return us;
  };

  bool got;
  try {
    got = r_.read_next(out);
  } catch (...) {
    record(); // a failing pull still counts
    throw;
  }
  const double us = record();
  if (trace_) trace_(calls_, us, got);
  return got;
}

std::string PullProfiler::summary() const {
  std::ostringstream o;
  o.setf(std::ios::fixed);
  o.precision(2);
  o << "[debug] read_next: calls=" << calls_
    << " total=" << total_ms() << "ms"
    << " mean=" << mean_us() << "us"
    << " slowest=" << slowest_ms() << "ms";
  return o.str();
}

}
