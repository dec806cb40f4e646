#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace blr {

enum class Compression { None, Gzip, Bzip2, Xz, Lzma };

// What to do with bytes that are not valid in the configured encoding:
// strict -> DecodeError; ignore -> drop them; replace -> U+FFFD
enum class ErrorPolicy { Strict, Ignore, Replace };

// Guess compression from extension (.gz | .bz2 | .xz | .lzma), ignoring case.
Compression detect_compression(std::string_view path);

const char* to_string(Compression c) noexcept;
const char* to_string(ErrorPolicy p) noexcept;

// "strict" | "ignore" | "replace"; throws std::invalid_argument otherwise.
ErrorPolicy parse_error_policy(std::string_view s);

// Plain integer or integer with a K/M/G suffix (binary units).
// Throws std::invalid_argument on junk or zero.
std::size_t parse_byte_size(std::string_view s);

// Chunk size used when the caller does not pick one. Decompressors run
// slower than plain reads, bzip2 slowest of all, so they get smaller chunks.
std::size_t default_chunk_bytes(Compression c) noexcept;

}
