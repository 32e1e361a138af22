#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "trackable_upload/trackable_stream.hpp"

namespace tu {

struct UploadConfig {
  std::string file;
  std::string url;            // http(s)://host[:port]/path
  std::string key;            // appended when url path ends with '/'; default: file basename
  std::string content_type;   // empty -> guessed from extension
  std::string method = "PUT";
  std::size_t chunk_size = TrackableStream::kDefaultChunkSize;
  int connect_timeout_s = 10;
  int read_timeout_s    = 60;
  int write_timeout_s   = 60;
  bool verify_tls = true;
  bool progress   = true;
  std::string report_path;    // empty -> no report
  std::vector<std::pair<std::string, std::string>> headers;
};

// Overlay fields from a JSON object file onto `cfg`. Unknown fields are errors.
bool load_config_json(const std::string& path, UploadConfig& cfg, std::string* err_out = nullptr);

// Checks required fields and value ranges.
bool validate_config(const UploadConfig& cfg, std::string* err_out = nullptr);

}
