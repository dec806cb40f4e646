#include "buffered_reader/line_reader.hpp"
#include "buffered_reader/metrics.hpp"
#include "buffered_reader/pull_profiler.hpp"
#include "buffered_reader/stats_json.hpp"
#include "../test_support.hpp"

#include <cstdint>
#include <string>

using blr_test::expect;

static bool has(const std::string& s, const std::string& part) {
  return s.find(part) != std::string::npos;
}

int main() {
  {
    blr::ReaderCounters c;
    expect(c.elapsed_seconds() == 0.0 && !c.started(), "idle counters");
    c.mark_start();
    c.add_line(); c.add_line();
    c.add_bytes(1 << 20);
    c.mark_finish();
    const double frozen = c.elapsed_seconds();
    expect(c.finished() && c.elapsed_seconds() == frozen, "clock frozen at finish");
    const auto st = c.snapshot("f.txt", "buffered");
    expect(st.lines == 2 && st.bytes == (1u << 20), "snapshot copies counters");
    expect(st.seconds == frozen, "snapshot uses frozen time");
    c.reset();
    expect(c.lines() == 0 && c.bytes() == 0 && !c.started() && !c.finished(), "reset clears everything");
  }

  {
    blr::ReaderStats st;
    st.file = "big \"log\".txt";
    st.mode = "buffered";
    st.lines = 1000;
    st.bytes = 3 * 1024 * 1024;
    st.seconds = 1.23456;
    st.lines_per_second = 810.04;
    st.megabytes_per_second = 2.43005;
    const std::string js = blr::StatsJsonWriter::to_json(st, 4096);
    expect(has(js, "\"file\":\"big \\\"log\\\".txt\""), "file name escaped: " + js);
    expect(has(js, "\"mode\":\"buffered\""), "mode key");
    expect(has(js, "\"lines\":1000"), "lines key");
    expect(has(js, "\"bytes\":3145728"), "bytes key");
    expect(has(js, "\"time\":1.23"), "time rounded to 2 decimals");
    expect(has(js, "\"lines_per_second\":810,"), "lines/s as integer");
    expect(has(js, "\"megabytes_per_second\":2.43"), "MB/s rounded");
    expect(has(js, "\"file_size\":4096"), "file size");
    expect(js.front() == '{' && js.back() == '}', "single object");

    const std::string line = blr::format_stats_line(st);
    expect(has(line, "1000 lines") && has(line, "[buffered]"), "summary line: " + line);
  }

  {
    auto p = blr_test::write_plain("a\nb\nc");
    blr::LineReader r(p.string());
    std::uint64_t traced = 0, with_line = 0;
    blr::PullProfiler prof(r, [&](std::uint64_t, double us, bool got){
      ++traced;
      if (got) ++with_line;
      expect(us >= 0.0, "non-negative pull time");
    });
    std::string_view v;
    std::uint64_t n = 0;
    while (prof.read_next(v)) ++n;
    expect(n == 3, "profiler passes lines through");
    expect(prof.calls() == 4 && traced == 4 && with_line == 3, "every pull counted, last one empty");
    expect(prof.slowest_ms() <= prof.total_ms(), "slowest within total");
    expect(has(prof.summary(), "calls=4"), "summary mentions call count: " + prof.summary());
    expect(r.stats().lines == 3, "reader counters unaffected by the wrapper");
  }

  blr_test::remove_temp_dir();
  return blr_test::finish("stats_output");
}
