#include "buffered_reader/stats_json.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace blr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }
static inline double round2(double v){ return std::round(safe_num(v) * 100.0) / 100.0; }

std::string StatsJsonWriter::to_json(const ReaderStats& s, std::uint64_t file_size) {
  std::ostringstream o;
  o << "{";
  o << "\"file\":"; esc(o, s.file); o << ",";
  o << "\"mode\":"; esc(o, s.mode); o << ",";
  o << "\"lines\":" << s.lines << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"time\":" << round2(s.seconds) << ",";
  o << "\"lines_per_second\":" << static_cast<std::uint64_t>(safe_num(s.lines_per_second)) << ",";
  o << "\"megabytes_per_second\":" << round2(s.megabytes_per_second) << ",";
  o << "\"file_size\":" << file_size;
  o << "}";
  return o.str();
}

std::string format_stats_line(const ReaderStats& s) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "%llu lines, %.2f MB in %.2f s (%llu lines/s, %.2f MB/s) [%s]",
                static_cast<unsigned long long>(s.lines),
                s.bytes / (1024.0 * 1024.0),
                safe_num(s.seconds),
                static_cast<unsigned long long>(safe_num(s.lines_per_second)),
                safe_num(s.megabytes_per_second),
                s.mode.c_str());
  return s.file + ": " + buf;
}

}
