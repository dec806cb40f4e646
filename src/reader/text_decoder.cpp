#include "buffered_reader/text_decoder.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace blr {

static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

Encoding parse_encoding(std::string_view name) {
  std::string v(name);
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "utf-8" || v == "utf8") return Encoding::Utf8;
  if (v == "ascii" || v == "us-ascii") return Encoding::Ascii;
  if (v == "latin-1" || v == "latin1" || v == "iso-8859-1") return Encoding::Latin1;
  throw std::invalid_argument("unsupported encoding: " + std::string(name));
}

const char* to_string(Encoding e) noexcept {
  switch (e) {
    case Encoding::Ascii:  return "ascii";
    case Encoding::Latin1: return "latin-1";
    case Encoding::Utf8:   break;
  }
  return "utf-8";
}

TextDecoder::TextDecoder(Encoding enc, ErrorPolicy policy) : enc_(enc), policy_(policy) {}

bool TextDecoder::decode(std::string_view bytes, std::string& out, bool final) {
  switch (enc_) {
    case Encoding::Latin1:
      offset_ += bytes.size();
      decode_latin1(bytes, out);
      return true;
    case Encoding::Ascii:
      return decode_ascii(bytes, out);
    case Encoding::Utf8:
      break;
  }
  return decode_utf8(bytes, out, final);
}

bool TextDecoder::invalid(std::string& out, std::uint64_t at, unsigned char byte) {
  switch (policy_) {
    case ErrorPolicy::Ignore:
      return true;
    case ErrorPolicy::Replace:
      out.append(kReplacement, 3);
      return true;
    case ErrorPolicy::Strict:
      break;
  }
  char buf[96];
  std::snprintf(buf, sizeof(buf), "cannot decode byte 0x%02x at offset %llu as %s",
                static_cast<unsigned>(byte), static_cast<unsigned long long>(at),
                to_string(enc_));
  err_ = buf;
  return false;
}

void TextDecoder::decode_latin1(std::string_view in, std::string& out) {
  out.reserve(out.size() + in.size());
  for (unsigned char c : in) {
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
}

bool TextDecoder::decode_ascii(std::string_view in, std::string& out) {
  const std::uint64_t base = offset_;
  offset_ += in.size();
  out.reserve(out.size() + in.size());
  std::size_t run = 0;
  for (std::size_t i = 0; i < in.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(in[i]);
    if (c < 0x80) continue;
    out.append(in.data() + run, i - run);
    run = i + 1;
    if (!invalid(out, base + i, c)) return false;
  }
  out.append(in.data() + run, in.size() - run);
  return true;
}

// Well-formed UTF-8 per Unicode table 3-7. An ill-formed sequence is
// replaced (or dropped) as one unit: the lead byte plus whatever
// continuation bytes were valid before the first bad one.
bool TextDecoder::decode_utf8(std::string_view bytes, std::string& out, bool final) {
  std::string_view in = bytes;
  if (!pending_.empty()) {
    scratch_.assign(pending_);
    scratch_.append(bytes.data(), bytes.size());
    in = scratch_;
  }
  const std::uint64_t base = offset_ - pending_.size();
  offset_ += bytes.size();
  pending_.clear();

  const auto* p = reinterpret_cast<const unsigned char*>(in.data());
  const std::size_t n = in.size();
  out.reserve(out.size() + n);

  std::size_t i = 0, run = 0;
  while (i < n) {
    const unsigned char c = p[i];
    if (c < 0x80) { ++i; continue; }

    std::size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF; // range of the first continuation byte
    if (c >= 0xC2 && c <= 0xDF)      need = 1;
    else if (c == 0xE0)              { need = 2; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) need = 2;
    else if (c == 0xED)              { need = 2; hi = 0x9F; }
    else if (c >= 0xEE && c <= 0xEF) need = 2;
    else if (c == 0xF0)              { need = 3; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) need = 3;
    else if (c == 0xF4)              { need = 3; hi = 0x8F; }

    bool bad = (need == 0);
    std::size_t j = i + 1;
    if (!bad) {
      std::size_t k = 0;
      for (; k < need && j < n; ++k, ++j) {
        const unsigned char l = k == 0 ? lo : 0x80;
        const unsigned char h = k == 0 ? hi : 0xBF;
        if (p[j] < l || p[j] > h) { bad = true; break; }
      }
      if (!bad && k < need) {
        if (!final) {
          // cut by the chunk boundary: finish it with the next chunk
          out.append(in.data() + run, i - run);
          pending_.assign(in.data() + i, n - i);
          return true;
        }
        bad = true;
      }
    }

    if (bad) {
      out.append(in.data() + run, i - run);
      if (!invalid(out, base + i, c)) return false;
      run = j;
    }
    i = j;
  }
  out.append(in.data() + run, n - run);
  return true;
}

}
