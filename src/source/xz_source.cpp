#include "buffered_reader/byte_source.hpp"
#include "codec_input.hpp"

#include <cstdint>
#include <lzma.h>
#include <string>

namespace blr {

static const char* lzma_error_name(lzma_ret rc) {
  switch (rc) {
    case LZMA_MEM_ERROR:      return "out of memory";
    case LZMA_MEMLIMIT_ERROR: return "memory usage limit reached";
    case LZMA_FORMAT_ERROR:   return "not an xz/lzma stream";
    case LZMA_OPTIONS_ERROR:  return "unsupported compression options";
    case LZMA_DATA_ERROR:     return "corrupt xz/lzma data";
    case LZMA_BUF_ERROR:      return "unexpected end of xz/lzma stream";
    default:                  return "lzma error";
  }
}

struct XzSource::State {
  detail::CodecInput in;
  lzma_stream ls = LZMA_STREAM_INIT;
  bool live{false};
  std::uint64_t consumed{0};

  State(UniqueFd fd, std::string name) : in(std::move(fd), std::move(name)) {
    // auto decoder: .xz or legacy .lzma; CONCATENATED reads every stream
    lzma_ret rc = lzma_auto_decoder(&ls, UINT64_MAX, LZMA_CONCATENATED);
    if (rc != LZMA_OK) throw DecodeError(in.name + ": " + lzma_error_name(rc));
    live = true;
  }
  ~State() { release(); }

  void release() noexcept {
    if (live) { lzma_end(&ls); live = false; }
    in.fd.reset();
  }
};

XzSource::XzSource(UniqueFd fd, std::string name)
  : st_(new State(std::move(fd), std::move(name))) {}
XzSource::XzSource(XzSource&&) noexcept = default;
XzSource& XzSource::operator=(XzSource&&) noexcept = default;
XzSource::~XzSource() = default;

void XzSource::close() noexcept {
  if (st_) st_->release();
}

std::size_t XzSource::read_some(char* dst, std::size_t n) {
  State& s = *st_;
  s.in.check();
  if (s.in.done || !s.live || n == 0) return 0;

  s.ls.next_out = reinterpret_cast<std::uint8_t*>(dst);
  s.ls.avail_out = n;

  while (s.ls.avail_out > 0) {
    if (s.ls.avail_in == 0 && !s.in.eof) {
      s.ls.next_in = s.in.buf.data();
      s.ls.avail_in = s.in.fill();
    }

    const std::size_t before_in = s.ls.avail_in;
    // LZMA_CONCATENATED only finishes once told the input has ended
    lzma_ret rc = lzma_code(&s.ls, s.in.eof ? LZMA_FINISH : LZMA_RUN);
    s.consumed += before_in - s.ls.avail_in;
    const std::size_t produced = n - s.ls.avail_out;

    if (rc == LZMA_STREAM_END) { s.in.done = true; break; }
    if (rc == LZMA_OK) continue;
    if (rc == LZMA_BUF_ERROR && s.consumed == 0) { s.in.done = true; break; } // empty file
    return s.in.fail(lzma_error_name(rc), produced);
  }
  return n - s.ls.avail_out;
}

}
