#include "buffered_reader/metrics.hpp"

#include <utility>

namespace blr {

void ReaderCounters::reset() {
  lines_ = bytes_ = 0;
  start_ = finish_ = clock::time_point{};
  started_ = finished_ = false;
}

void ReaderCounters::mark_start() {
  if (started_) return;
  start_ = clock::now();
  started_ = true;
}

void ReaderCounters::mark_finish() {
  if (!started_ || finished_) return;
  finish_ = clock::now();
  finished_ = true;
}

double ReaderCounters::elapsed_seconds() const {
  if (!started_) return 0.0;
  const auto end = finished_ ? finish_ : clock::now();
  return std::chrono::duration<double>(end - start_).count();
}

ReaderStats ReaderCounters::snapshot(std::string file, std::string mode) const {
  ReaderStats r;
  r.file = std::move(file);
  r.mode = std::move(mode);
  r.lines = lines_;
  r.bytes = bytes_;
  r.seconds = elapsed_seconds();
  r.lines_per_second = (r.seconds > 0.0) ? lines_ / r.seconds : 0.0;
  r.megabytes_per_second = (r.seconds > 0.0) ? (bytes_ / (1024.0*1024.0)) / r.seconds : 0.0;
  return r;
}

}
