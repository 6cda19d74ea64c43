#include "jsonl_rev/run_stats.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace jr {

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
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunStatsWriter::to_json(const RunStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"mode\":";         esc(o, s.mode);         o << ",";
  o << "\"filename\":";     esc(o, s.filename);     o << ",";
  o << "\"content_type\":"; esc(o, s.content_type); o << ",";
  o << "\"file_size\":" << s.file_size << ",";
  o << "\"buffer_bytes\":" << s.buffer_bytes << ",";
  o << "\"lines\":" << s.lines << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes_read\":" << s.bytes_read << ",";
  o << "\"fetches\":" << s.fetches << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"ok\":" << (s.ok ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, s.error);
  o << "}";
  return o.str();
}

}
