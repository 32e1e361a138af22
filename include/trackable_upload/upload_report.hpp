#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "trackable_upload/metrics.hpp"

namespace tu {

struct UploadReportPayload {
  // Outcome
  bool ok = false;
  int http_status = 0;
  std::string error;

  // Transfer KPIs
  std::uint64_t file_size = 0;
  std::uint64_t bytes_sent = 0;
  std::uint64_t chunks = 0;
  std::uint64_t chunk_size = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::vector<ThroughputSample> series;

  // Input metadata
  std::string filename;
  std::string url;
  std::string content_type;
};

class UploadReportWriter {
public:
  static std::string to_json(const UploadReportPayload& p);
};

// Writes the JSON report to `path`, creating parent directories.
bool write_upload_report(const std::string& path,
                         const UploadReportPayload& p,
                         std::string* err_out = nullptr);

}
