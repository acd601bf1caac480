#include "row_reader/run_json.hpp"
#include <cstdio>
#include <sstream>
#include <cmath> // std::isfinite

namespace rr {

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

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << p.rows << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"width\":" << p.width << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";
  o << "\"status\":"; esc(o, p.status); o << ",";
  o << "\"error\":";  esc(o, p.error);  o << ",";

  o << "\"columns\":[";
  for (size_t i=0;i<p.columns.size();++i){
    if (i) o << ",";
    esc(o, p.columns[i]);
  }
  o << "],";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << safe_num(p.stage_times[i].second) << "}";
  }
  o << "],";

  o << "\"errors_by_field\":{";
  bool first=true;
  for (auto& kv : p.errors_by_field) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"content_type\":"; esc(o, p.content_type); o << ",";
  o << "\"slug\":";         esc(o, p.slug);         o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
