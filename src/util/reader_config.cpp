#include "buffered_reader/reader_config.hpp"

#include <cctype>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>

namespace blr {

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

Compression detect_compression(std::string_view path) {
  auto ext = lower(std::filesystem::path(std::string(path)).extension().string());
  if (ext == ".gz")   return Compression::Gzip;
  if (ext == ".bz2")  return Compression::Bzip2;
  if (ext == ".xz")   return Compression::Xz;
  if (ext == ".lzma") return Compression::Lzma;
  return Compression::None;
}

const char* to_string(Compression c) noexcept {
  switch (c) {
    case Compression::Gzip:  return "gz";
    case Compression::Bzip2: return "bz2";
    case Compression::Xz:    return "xz";
    case Compression::Lzma:  return "lzma";
    case Compression::None:  break;
  }
  return "none";
}

const char* to_string(ErrorPolicy p) noexcept {
  switch (p) {
    case ErrorPolicy::Strict: return "strict";
    case ErrorPolicy::Ignore: return "ignore";
    case ErrorPolicy::Replace: break;
  }
  return "replace";
}

ErrorPolicy parse_error_policy(std::string_view s) {
  auto v = lower(std::string(s));
  if (v == "strict")  return ErrorPolicy::Strict;
  if (v == "ignore")  return ErrorPolicy::Ignore;
  if (v == "replace") return ErrorPolicy::Replace;
  throw std::invalid_argument("unknown error policy: " + std::string(s));
}

std::size_t parse_byte_size(std::string_view s) {
  if (s.empty()) throw std::invalid_argument("empty byte size");
  std::size_t mult = 1;
  switch (std::tolower(static_cast<unsigned char>(s.back()))) {
    case 'k': mult = std::size_t(1) << 10; break;
    case 'm': mult = std::size_t(1) << 20; break;
    case 'g': mult = std::size_t(1) << 30; break;
    default: break;
  }
  std::string digits(mult == 1 ? s : s.substr(0, s.size() - 1));
  if (digits.empty()) throw std::invalid_argument("bad byte size: " + std::string(s));
  for (char c : digits)
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw std::invalid_argument("bad byte size: " + std::string(s));

  unsigned long long n = std::stoull(digits); // out_of_range on overflow
  if (n == 0) throw std::invalid_argument("byte size must be > 0");
  if (n > std::numeric_limits<std::size_t>::max() / mult)
    throw std::invalid_argument("byte size too large: " + std::string(s));
  return static_cast<std::size_t>(n) * mult;
}

std::size_t default_chunk_bytes(Compression c) noexcept {
  constexpr std::size_t MiB = 1024 * 1024;
  switch (c) {
    case Compression::None:  return 128 * MiB;
    case Compression::Gzip:  return 32 * MiB;
    case Compression::Bzip2: return 16 * MiB;
    case Compression::Xz:
    case Compression::Lzma:  return 32 * MiB;
  }
  return 16 * MiB;
}

}
