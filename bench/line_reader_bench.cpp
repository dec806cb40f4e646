#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

#include "buffered_reader/line_reader.hpp"
#include "buffered_reader/reader_config.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string synth_line(std::size_t r, std::size_t width) {
  std::string s = "row " + std::to_string(r) + " ";
  while (s.size() < width) s += static_cast<char>('a' + (r + s.size()) % 26);
  return s;
}

static std::string make_synth_plain(std::size_t rows, std::size_t width) {
  fs::path p = fs::temp_directory_path() / "blr_bench_synth.txt";
  std::ofstream out(p, std::ios::binary);
  for (std::size_t r = 0; r < rows; ++r) out << synth_line(r, width) << "\n";
  out.flush();
  return p.string();
}

static std::string make_synth_gz(std::size_t rows, std::size_t width) {
  fs::path p = fs::temp_directory_path() / "blr_bench_synth.txt.gz";
  gzFile gz = gzopen(p.string().c_str(), "wb6");
  if (!gz) { std::cerr << "[bench] cannot create " << p << "\n"; std::exit(1); }
  for (std::size_t r = 0; r < rows; ++r) {
    std::string s = synth_line(r, width) + "\n";
    gzwrite(gz, s.data(), static_cast<unsigned>(s.size()));
  }
  gzclose(gz);
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth plain + gz
  std::size_t rows = 1'000'000;
  std::size_t width = 80;
  int iters = 3;
  std::vector<std::size_t> chunks{64 * 1024, 1024 * 1024, 16 * 1024 * 1024, 0};
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--file") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--width") a.width = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--chunk") a.chunks = {blr::parse_byte_size(val)};
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: blr_bench_reader [--file=path] [--rows=N] [--width=W] [--iters=K] [--chunk=N[K|M|G]]\n"
        "Without --file a synthetic text file and its gzip copy are generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_file(const std::string& path, const Args& a) {
  std::cout << "\n[" << blr::to_string(blr::detect_compression(path)) << "] file=" << path
            << " iters=" << a.iters << "\n";
  for (std::size_t chunk : a.chunks) {
    for (int k=1;k<=a.iters;++k) {
      blr::LineReader::Config cfg;
      cfg.chunk_bytes = chunk;
      blr::LineReader rd(path, cfg);
      std::uint64_t width_sum = 0;

      auto t0 = clk::now();
      std::uint64_t n = rd.for_each_line([&](std::string_view s){ width_sum += s.size(); });
      auto t1 = clk::now();

      const double sec = std::chrono::duration<double>(t1-t0).count();
      const auto st = rd.stats();
      const double mib = st.bytes / (1024.0*1024.0);
      std::cout << "  chunk=" << rd.chunk_bytes()
                << " iter " << k
                << ": lines=" << n
                << " bytes=" << st.bytes
                << " time=" << sec << "s"
                << "  throughput=" << (mib/sec) << " MiB/s"
                << "  lines/s=" << (n/sec)
                << "  queue_peak=" << rd.queue_high_water()
                << (width_sum == 0 ? "  (empty)" : "") << "\n";
    }
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);
  if (!a.path.empty() && fs::exists(a.path)) {
    bench_file(a.path, a);
    return 0;
  }
  bench_file(make_synth_plain(a.rows, a.width), a);
  bench_file(make_synth_gz(a.rows, a.width), a);
  return 0;
}
