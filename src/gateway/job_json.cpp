#include "csv_stream/job_store.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace cs {

static void esc(std::ostringstream& o, std::string_view s){
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
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
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

std::string job_to_json(const JobRecord& r) {
  std::ostringstream o;
  o << std::setprecision(15);
  o << "{";
  o << "\"job_id\":";   esc(o, r.job_id);   o << ",";
  o << "\"filename\":"; esc(o, r.filename); o << ",";
  o << "\"file_size_bytes\":" << r.file_size_bytes << ",";
  o << "\"status\":";   esc(o, to_string(r.status)); o << ",";
  o << "\"rows_processed\":" << r.rows_processed << ",";
  o << "\"malformed_rows\":" << r.malformed_rows << ",";
  o << "\"processed_percentage\":" << safe_num(r.processed_percentage) << ",";
  if (!r.message.empty()) { o << "\"message\":"; esc(o, r.message); o << ","; }

  if (r.status == JobStatus::Complete) {
    o << "\"total_sales\":" << r.total_sales << ",";
    o << "\"unique_departments\":" << r.unique_departments << ",";
    o << "\"processing_time_seconds\":" << safe_num(r.processing_time_seconds) << ",";
    o << "\"result_file_name\":"; esc(o, r.result_file_name); o << ",";
    o << "\"result_file_url\":";  esc(o, r.result_file_url);  o << ",";
    o << "\"storage_result_file_url\":";
    if (r.storage_result_file_url) esc(o, *r.storage_result_file_url); else o << "null";
    o << ",";
  }
  if (!r.error.empty()) { o << "\"error\":"; esc(o, r.error); o << ","; }

  o << "\"created_at\":" << safe_num(r.created_at) << ",";
  o << "\"updated_at\":" << safe_num(r.updated_at);
  o << "}";
  return o.str();
}

std::string json_message(std::string_view key, std::string_view value) {
  std::ostringstream o;
  o << "{";
  esc(o, key); o << ":"; esc(o, value);
  o << "}";
  return o.str();
}

}
