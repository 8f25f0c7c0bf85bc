#include "source_mux/run_json.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace smux {

static void esc(std::ostringstream& o, const std::string& s) {
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v) { return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << s.rows << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(s.rows_per_sec) << ",";
  o << "\"format\":"; esc(o, s.format); o << ",";

  o << "\"header\":[";
  for (size_t i = 0; i < s.header.size(); ++i) {
    if (i) o << ",";
    esc(o, s.header[i]);
  }
  o << "],";

  o << "\"sources\":[";
  for (size_t i = 0; i < s.sources.size(); ++i) {
    if (i) o << ",";
    o << "{\"name\":"; esc(o, s.sources[i].first);
    o << ",\"rows\":" << s.sources[i].second << "}";
  }
  o << "],";

  o << "\"status\":"; esc(o, s.status); o << ",";
  o << "\"message\":"; esc(o, s.message);
  o << "}";
  return o.str();
}

}
