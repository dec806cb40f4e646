#include "buffered_reader/errors.hpp"
#include "buffered_reader/line_reader.hpp"
#include "buffered_reader/pull_profiler.hpp"
#include "buffered_reader/reader_config.hpp"
#include "buffered_reader/stats_json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct Cli {
  blr::LineReader::Config reader;
  bool count_only = false;
  bool print_stats = false;
  bool debug = false;
  std::string stats_json;          // write the last file's stats here
  std::vector<std::string> files;  // "-" reads stdin
};

void usage(std::ostream& os) {
  os <<
    "Usage: blr-cat [--chunk-bytes=N[K|M|G]] [--encoding=utf-8|ascii|latin-1]\n"
    "               [--errors=strict|ignore|replace] [--queue=N]\n"
    "               [--count] [--stats] [--stats-json=PATH] [--debug] <file|->...\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--chunk-bytes=", &v)) { c.reader.chunk_bytes = blr::parse_byte_size(v); continue; }
    if (eat("--encoding=", &v))    { c.reader.encoding = v; continue; }
    if (eat("--errors=", &v))      { c.reader.errors = blr::parse_error_policy(v); continue; }
    if (eat("--queue=", &v))       { c.reader.queue_capacity = std::stoul(v); continue; }
    if (eat("--stats-json=", &c.stats_json)) continue;
    if (a == "--count") { c.count_only = true; continue; }
    if (a == "--stats") { c.print_stats = true; continue; }
    if (a == "--debug") { c.debug = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-' && a != "-")
      throw std::invalid_argument("unknown option: " + a);
    c.files.push_back(a);
  }
  if (c.files.empty()) throw std::invalid_argument("no input files");
  return c;
}

bool write_stats_json(const std::string& path, const std::string& json) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out << json << "\n";
  return static_cast<bool>(out);
}

std::uint64_t pump(blr::LineReader& reader, const Cli& cli) {
  std::uint64_t n = 0;
  std::string_view line;
  if (cli.debug) {
    blr::PullProfiler prof(reader);
    while (prof.read_next(line)) {
      ++n;
      if (!cli.count_only) std::cout << line << '\n';
    }
    std::cerr << prof.summary() << "\n";
    return n;
  }
  while (reader.read_next(line)) {
    ++n;
    if (!cli.count_only) std::cout << line << '\n';
  }
  return n;
}

int cat_one(const std::string& file, const Cli& cli) {
  const bool from_stdin = (file == "-");
  int fd = from_stdin ? ::dup(STDIN_FILENO) : -1;
  auto owned = from_stdin
      ? std::make_unique<blr::LineReader>(fd, std::string(), cli.reader)
      : std::make_unique<blr::LineReader>(file, cli.reader);
  blr::LineReader& reader = *owned;

  if (cli.debug) {
    std::cerr << "[debug] open " << file
              << " compression=" << blr::to_string(reader.compression())
              << " chunk_bytes=" << reader.chunk_bytes() << "\n";
  }

  const std::uint64_t n = pump(reader, cli);
  if (cli.count_only) std::cout << n << (cli.files.size() > 1 ? "\t" + file : "") << "\n";

  const blr::ReaderStats st = reader.stats();
  if (cli.print_stats) std::cerr << "[blr-cat] " << blr::format_stats_line(st) << "\n";
  if (!cli.stats_json.empty()) {
    std::error_code fec;
    std::uint64_t size = from_stdin ? 0 : std::filesystem::file_size(file, fec);
    if (fec) size = 0;
    if (!write_stats_json(cli.stats_json, blr::StatsJsonWriter::to_json(st, size))) {
      std::cerr << "[blr-cat] cannot write " << cli.stats_json << "\n";
      return 2;
    }
  }
  reader.close();
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[blr-cat] " << e.what() << "\n";
    usage(std::cerr);
    return 1;
  }

  std::ios::sync_with_stdio(false);
  int rc = 0;
  for (const auto& f : cli.files) {
    try {
      int one = cat_one(f, cli);
      if (one != 0) rc = one;
    } catch (const blr::DecodeError& e) {
      std::cout.flush();
      std::cerr << "[blr-cat] " << e.what() << "\n";
      rc = 3;
    } catch (const blr::ReaderError& e) {
      std::cout.flush();
      std::cerr << "[blr-cat] " << e.what() << "\n";
      rc = 2;
    } catch (const std::invalid_argument& e) {
      std::cerr << "[blr-cat] " << e.what() << "\n";
      return 1;
    }
  }
  std::cout.flush();
  return rc;
}
