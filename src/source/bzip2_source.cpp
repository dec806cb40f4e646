#include "buffered_reader/byte_source.hpp"
#include "codec_input.hpp"

#include <algorithm>
#include <bzlib.h>
#include <climits>
#include <cstdint>
#include <string>

namespace blr {

static const char* bz_error_name(int rc) {
  switch (rc) {
    case BZ_DATA_ERROR:       return "corrupt bzip2 data";
    case BZ_DATA_ERROR_MAGIC: return "not a bzip2 stream";
    case BZ_MEM_ERROR:        return "out of memory";
    case BZ_PARAM_ERROR:      return "bad decompressor parameters";
    default:                  return "bzip2 error";
  }
}

struct Bzip2Source::State {
  detail::CodecInput in;
  bz_stream bs{};
  bool live{false};
  bool stream_done{false};
  std::uint64_t stream_in{0}; // compressed bytes fed to the current stream

  State(UniqueFd fd, std::string name) : in(std::move(fd), std::move(name)) { init(); }
  ~State() { release(); }

  void init() {
    // keep bs.next_in/avail_in across re-initialisation for multi-stream files
    char* next_in = bs.next_in;
    unsigned avail_in = bs.avail_in;
    bs.bzalloc = nullptr; bs.bzfree = nullptr; bs.opaque = nullptr;
    int rc = BZ2_bzDecompressInit(&bs, 0, 0);
    if (rc != BZ_OK) throw DecodeError(in.name + ": " + bz_error_name(rc));
    bs.next_in = next_in;
    bs.avail_in = avail_in;
    live = true;
    stream_done = false;
    stream_in = 0;
  }

  void end() noexcept {
    if (live) { BZ2_bzDecompressEnd(&bs); live = false; }
  }

  void release() noexcept {
    end();
    in.fd.reset();
  }
};

Bzip2Source::Bzip2Source(UniqueFd fd, std::string name)
  : st_(new State(std::move(fd), std::move(name))) {}
Bzip2Source::Bzip2Source(Bzip2Source&&) noexcept = default;
Bzip2Source& Bzip2Source::operator=(Bzip2Source&&) noexcept = default;
Bzip2Source::~Bzip2Source() = default;

void Bzip2Source::close() noexcept {
  if (st_) st_->release();
}

std::size_t Bzip2Source::read_some(char* dst, std::size_t n) {
  State& s = *st_;
  s.in.check();
  if (s.in.done || n == 0) return 0;
  if (!s.live && !s.stream_done) return 0; // closed

  const unsigned want = static_cast<unsigned>(std::min<std::size_t>(n, UINT_MAX));
  s.bs.next_out = dst;
  s.bs.avail_out = want;

  while (s.bs.avail_out > 0) {
    if (s.bs.avail_in == 0 && !s.in.eof) {
      s.bs.next_in = reinterpret_cast<char*>(s.in.buf.data());
      s.bs.avail_in = static_cast<unsigned>(s.in.fill());
    }
    if (s.stream_done) {
      if (s.bs.avail_in == 0) { s.in.done = true; break; }
      // concatenated .bz2: start a fresh stream on the remaining input
      const unsigned left = s.bs.avail_out;
      s.init();
      s.bs.next_out = dst + (want - left);
      s.bs.avail_out = left;
    }

    const unsigned before_in = s.bs.avail_in;
    const unsigned before_out = s.bs.avail_out;
    int rc = BZ2_bzDecompress(&s.bs);
    s.stream_in += before_in - s.bs.avail_in;
    const std::size_t produced = want - s.bs.avail_out;

    if (rc == BZ_STREAM_END) {
      s.end();
      s.stream_done = true;
      continue;
    }
    if (rc != BZ_OK) return s.in.fail(bz_error_name(rc), produced);

    const bool stalled = s.bs.avail_out == before_out && s.bs.avail_in == before_in;
    if (stalled && s.in.eof && s.bs.avail_in == 0) {
      if (s.stream_in == 0) { s.in.done = true; break; } // empty file
      return s.in.fail("unexpected end of bzip2 stream", produced);
    }
  }
  return want - s.bs.avail_out;
}

}
