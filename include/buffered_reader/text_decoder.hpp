#pragma once
#include "buffered_reader/reader_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace blr {

enum class Encoding { Utf8, Ascii, Latin1 };

// "utf-8" | "utf8" | "ascii" | "us-ascii" | "latin-1" | "latin1" |
// "iso-8859-1", case-insensitive. Throws std::invalid_argument otherwise.
Encoding parse_encoding(std::string_view name);
const char* to_string(Encoding e) noexcept;

// Chunk-at-a-time decoder producing UTF-8. A multi-byte sequence cut by the
// end of a chunk is held back and completed by the next decode() call, so
// the output does not depend on where chunk boundaries fall.
class TextDecoder {
public:
  TextDecoder(Encoding enc, ErrorPolicy policy);

  // Append the decoded form of `bytes` to `out`. `final` marks the last
  // chunk of the stream; a sequence still incomplete then is invalid.
  // Returns false only under ErrorPolicy::Strict: `out` then holds the text
  // decoded before the offending byte and error() describes it.
  bool decode(std::string_view bytes, std::string& out, bool final = false);

  const std::string& error() const { return err_; }

  // Bytes consumed so far, including held-back ones.
  std::uint64_t offset() const noexcept { return offset_; }
  std::size_t pending() const noexcept { return pending_.size(); }

private:
  bool decode_utf8(std::string_view in, std::string& out, bool final);
  bool decode_ascii(std::string_view in, std::string& out);
  void decode_latin1(std::string_view in, std::string& out);
  bool invalid(std::string& out, std::uint64_t at, unsigned char byte);

  Encoding enc_;
  ErrorPolicy policy_;
  std::string pending_;   // incomplete utf-8 tail of the previous chunk
  std::string scratch_;
  std::uint64_t offset_{0};
  std::string err_;
};

}
