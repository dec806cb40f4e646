#include "buffered_reader/reader_config.hpp"
#include "../test_support.hpp"

#include <stdexcept>
#include <string>

using blr_test::expect;

template <class F>
static bool rejects(F&& f) {
  try { f(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

int main() {
  expect(blr::parse_byte_size("4096") == 4096, "plain integer");
  expect(blr::parse_byte_size("64K") == 64 * 1024, "K suffix");
  expect(blr::parse_byte_size("16m") == 16u * 1024 * 1024, "m suffix");
  expect(blr::parse_byte_size("1G") == 1024u * 1024 * 1024, "G suffix");
  expect(rejects([]{ blr::parse_byte_size(""); }), "empty size");
  expect(rejects([]{ blr::parse_byte_size("0"); }), "zero size");
  expect(rejects([]{ blr::parse_byte_size("M"); }), "suffix only");
  expect(rejects([]{ blr::parse_byte_size("12x"); }), "bad suffix");
  expect(rejects([]{ blr::parse_byte_size("-5"); }), "negative size");

  expect(blr::parse_error_policy("strict") == blr::ErrorPolicy::Strict, "strict");
  expect(blr::parse_error_policy("IGNORE") == blr::ErrorPolicy::Ignore, "ignore, any case");
  expect(blr::parse_error_policy("replace") == blr::ErrorPolicy::Replace, "replace");
  expect(rejects([]{ blr::parse_error_policy("lenient"); }), "unknown policy");
  expect(std::string(blr::to_string(blr::ErrorPolicy::Replace)) == "replace", "policy name");

  expect(blr::detect_compression("x.gz") == blr::Compression::Gzip, ".gz");
  expect(blr::detect_compression("x.bz2") == blr::Compression::Bzip2, ".bz2");
  expect(blr::detect_compression("x.xz") == blr::Compression::Xz, ".xz");
  expect(blr::detect_compression("x.lzma") == blr::Compression::Lzma, ".lzma");
  expect(blr::detect_compression("x.txt.gz") == blr::Compression::Gzip, "last extension wins");
  expect(blr::detect_compression("x.gz.txt") == blr::Compression::None, "inner .gz ignored");
  expect(blr::detect_compression("") == blr::Compression::None, "no name");

  expect(blr::default_chunk_bytes(blr::Compression::None) >
         blr::default_chunk_bytes(blr::Compression::Gzip), "plain chunks larger than gzip");
  expect(blr::default_chunk_bytes(blr::Compression::Bzip2) <
         blr::default_chunk_bytes(blr::Compression::Xz), "bzip2 chunks smallest");

  return blr_test::finish("reader_config");
}
