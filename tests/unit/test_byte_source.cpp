#include "buffered_reader/byte_source.hpp"
#include "buffered_reader/errors.hpp"
#include "../test_support.hpp"

#include <cstdint>
#include <fcntl.h>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

using blr_test::expect;

// Text that does not compress to nothing, so the codecs need several refills.
static std::string noisy_text(std::size_t bytes) {
  std::string s;
  s.reserve(bytes + 64);
  std::uint32_t x = 2463534242u;
  while (s.size() < bytes) {
    x ^= x << 13; x ^= x >> 17; x ^= x << 5;
    s += std::to_string(x);
    s += (x % 4 == 0) ? '\n' : ' ';
  }
  s.resize(bytes);
  return s;
}

static std::string drain(blr::ByteSource& src, std::size_t chunk, bool* exact_chunks = nullptr) {
  std::vector<std::string> parts;
  while (true) {
    std::string c = src.read_chunk(chunk);
    if (c.empty()) break;
    parts.push_back(std::move(c));
  }
  std::string all;
  bool exact = true;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i + 1 < parts.size() && parts[i].size() != chunk) exact = false;
    all += parts[i];
  }
  if (exact_chunks) *exact_chunks = exact;
  return all;
}

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  {
    auto p = blr_test::write_plain(std::string(1000, 'a'));
    auto src = blr::ByteSource::open(p.string());
    expect(src.compression() == blr::Compression::None, "plain file sniffed as none");
    expect(src.read_chunk(300).size() == 300, "full chunk 1");
    expect(src.read_chunk(300).size() == 300, "full chunk 2");
    expect(src.read_chunk(300).size() == 300, "full chunk 3");
    expect(src.read_chunk(300).size() == 100, "short chunk only at end");
    expect(src.read_chunk(300).empty(), "empty chunk at end of stream");
    src.close();
    src.close();
    expect(throws<blr::ClosedResourceError>([&]{ src.read_chunk(1); }), "read after close");
  }

  const std::string payload = noisy_text(2 * 1024 * 1024 + 123);

  for (const char* ext : {".gz", ".bz2", ".xz", ".lzma"}) {
    const std::string tag = ext;
    auto p = blr_test::write_fixture(payload, ext);
    auto src = blr::ByteSource::open(p.string());
    bool exact = false;
    std::string got = drain(src, 64 * 1024, &exact);
    expect(got == payload, tag + ": decompressed bytes match");
    expect(exact, tag + ": every chunk but the last is full");

    auto empty = blr_test::write_fixture("", ext);
    auto esrc = blr::ByteSource::open(empty.string());
    expect(esrc.read_chunk(4096).empty(), tag + ": empty payload");

    auto zero = blr_test::write_plain("", ext);
    auto zsrc = blr::ByteSource::open(zero.string());
    expect(zsrc.read_chunk(4096).empty(), tag + ": zero-byte file reads as empty");

    // truncated mid-stream: whatever decodes is a prefix, then DecodeError
    std::string whole = blr_test::write_fixture(payload, ext).string();
    std::string comp;
    {
      std::ifstream in(whole, std::ios::binary);
      comp.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    auto cut = blr_test::write_plain(comp.substr(0, comp.size() / 2), ext);
    auto tsrc = blr::ByteSource::open(cut.string());
    std::string prefix;
    bool decode_error = false;
    try {
      while (true) {
        std::string c = tsrc.read_chunk(16 * 1024);
        if (c.empty()) break;
        prefix += c;
      }
    } catch (const blr::DecodeError&) {
      decode_error = true;
    }
    expect(decode_error, tag + ": truncated stream raises DecodeError");
    expect(payload.compare(0, prefix.size(), prefix) == 0, tag + ": bytes before the error are intact");

    auto junk = blr_test::write_plain("this is not compressed at all\n", ext);
    auto jsrc = blr::ByteSource::open(junk.string());
    expect(throws<blr::DecodeError>([&]{ jsrc.read_chunk(4096); }), tag + ": garbage raises DecodeError");
  }

  // concatenated members / streams
  {
    auto p = blr_test::write_plain(blr_test::gzip_bytes("one\n") + blr_test::gzip_bytes("two\n"), ".gz");
    auto src = blr::ByteSource::open(p.string());
    expect(drain(src, 4096) == "one\ntwo\n", "multi-member gzip");
  }
  {
    auto p = blr_test::write_plain(blr_test::bzip2_bytes("one\n") + blr_test::bzip2_bytes("two\n"), ".bz2");
    auto src = blr::ByteSource::open(p.string());
    expect(drain(src, 4096) == "one\ntwo\n", "multi-stream bzip2");
  }
  {
    auto p = blr_test::write_plain(blr_test::xz_bytes("one\n") + blr_test::xz_bytes("two\n"), ".xz");
    auto src = blr::ByteSource::open(p.string());
    expect(drain(src, 4096) == "one\ntwo\n", "concatenated xz");
  }

  expect(blr::detect_compression("a/b/LOG.GZ") == blr::Compression::Gzip, "extension case ignored");
  expect(blr::detect_compression("data.tar") == blr::Compression::None, "unknown extension is plain");

  expect(throws<blr::IoError>([]{ blr::ByteSource::open("/nonexistent/blr/file.txt"); }),
         "missing file raises IoError");

  {
    auto p = blr_test::write_plain("x\n");
    int wfd = ::open(p.c_str(), O_WRONLY);
    expect(throws<blr::InvalidModeError>([&]{ blr::ByteSource::adopt(wfd, p.string()); }),
           "write-only descriptor raises InvalidModeError");
    expect(::fcntl(wfd, F_GETFD) < 0, "rejected descriptor is closed by the reader");
  }
  expect(throws<blr::IoError>([]{ blr::ByteSource::adopt(-1, "bad"); }), "invalid descriptor raises IoError");

  {
    auto p = blr_test::write_fixture("adopted\n", ".gz");
    int fd = ::open(p.c_str(), O_RDONLY);
    auto src = blr::ByteSource::adopt(fd, p.string());
    expect(src.compression() == blr::Compression::Gzip, "adopted descriptor sniffed by name");
    expect(drain(src, 4096) == "adopted\n", "adopted gzip descriptor decodes");
  }

  blr_test::remove_temp_dir();
  return blr_test::finish("byte_source");
}
