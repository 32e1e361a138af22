#include "trackable_upload/upload_report.hpp"
#include "trackable_upload/path_utils.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace tu {

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
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
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

std::string UploadReportWriter::to_json(const UploadReportPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"ok\":" << (p.ok ? "true" : "false") << ",";
  o << "\"http_status\":" << p.http_status << ",";
  o << "\"error\":"; esc(o, p.error); o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"bytes_sent\":" << p.bytes_sent << ",";
  o << "\"chunks\":" << p.chunks << ",";
  o << "\"chunk_size\":" << p.chunk_size << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"series\":[";
  for (size_t i=0;i<p.series.size();++i){
    if (i) o << ",";
    const auto& s = p.series[i];
    o << "{"
      << "\"time_ms\":" << safe_num(s.time_ms) << ","
      << "\"bytes\":"   << s.bytes              << ","
      << "\"mb_s\":"    << safe_num(s.mb_s)
      << "}";
  }
  o << "],";

  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"url\":";          esc(o, p.url);          o << ",";
  o << "\"content_type\":"; esc(o, p.content_type);

  o << "}";
  return o.str();
}

bool write_upload_report(const std::string& path,
                         const UploadReportPayload& p,
                         std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "failed to create parent directories for " + path;
    return false;
  }
  const std::string json = UploadReportWriter::to_json(p);
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
