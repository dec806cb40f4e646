#include "buffered_reader/byte_source.hpp"
#include "codec_input.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <string>
#include <zlib.h>

namespace blr {

struct GzipSource::State {
  detail::CodecInput in;
  z_stream zs{};
  bool live{false};
  bool member_done{false};
  std::uint64_t member_in{0}; // compressed bytes fed to the current member

  State(UniqueFd fd, std::string name) : in(std::move(fd), std::move(name)) {
    // 15 window bits + 32: accept gzip or zlib headers
    if (inflateInit2(&zs, 15 + 32) != Z_OK)
      throw DecodeError(in.name + ": inflateInit2 failed");
    live = true;
  }
  ~State() { release(); }

  void release() noexcept {
    if (live) { inflateEnd(&zs); live = false; }
    in.fd.reset();
  }
};

GzipSource::GzipSource(UniqueFd fd, std::string name)
  : st_(new State(std::move(fd), std::move(name))) {}
GzipSource::GzipSource(GzipSource&&) noexcept = default;
GzipSource& GzipSource::operator=(GzipSource&&) noexcept = default;
GzipSource::~GzipSource() = default;

void GzipSource::close() noexcept {
  if (st_) st_->release();
}

std::size_t GzipSource::read_some(char* dst, std::size_t n) {
  State& s = *st_;
  s.in.check();
  if (s.in.done || !s.live || n == 0) return 0;

  const uInt want = static_cast<uInt>(std::min<std::size_t>(n, UINT_MAX));
  s.zs.next_out = reinterpret_cast<Bytef*>(dst);
  s.zs.avail_out = want;

  while (s.zs.avail_out > 0) {
    if (s.zs.avail_in == 0 && !s.in.eof) {
      s.zs.next_in = s.in.buf.data();
      s.zs.avail_in = static_cast<uInt>(s.in.fill());
    }
    if (s.member_done) {
      if (s.zs.avail_in == 0) { s.in.done = true; break; }
      // another gzip member follows (concatenated .gz)
      inflateReset(&s.zs);
      s.member_done = false;
      s.member_in = 0;
    }

    const uInt before_in = s.zs.avail_in;
    int rc = inflate(&s.zs, Z_NO_FLUSH);
    s.member_in += before_in - s.zs.avail_in;
    const std::size_t produced = want - s.zs.avail_out;

    if (rc == Z_STREAM_END) { s.member_done = true; continue; }
    if (rc == Z_OK) continue;
    if (rc == Z_BUF_ERROR && s.in.eof && s.zs.avail_in == 0) {
      if (s.member_in == 0) { s.in.done = true; break; } // empty file
      return s.in.fail("unexpected end of gzip stream", produced);
    }
    std::string why = s.zs.msg ? s.zs.msg : "inflate error " + std::to_string(rc);
    return s.in.fail(why, produced);
  }
  return want - s.zs.avail_out;
}

}
