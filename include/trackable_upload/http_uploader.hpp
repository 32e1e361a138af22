#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tu {

class UploadBody;

// Thin wrapper around the cpp-httplib client; streams an UploadBody with a
// declared Content-Length.
class HttpUploader {
public:
  struct Config {
    std::string base_url;                 // scheme://host[:port]
    std::string method = "PUT";           // PUT | POST
    std::string content_type = "application/octet-stream";
    std::vector<std::pair<std::string, std::string>> headers;
    int connect_timeout_s = 10;
    int read_timeout_s    = 60;
    int write_timeout_s   = 60;
    bool verify_tls = true;               // only meaningful with TU_USE_OPENSSL
  };

  struct Result {
    bool ok = false;
    int status = 0;                       // HTTP status, 0 if no response
    std::uint64_t bytes_sent = 0;
    std::string body;
    std::string error;
  };

  explicit HttpUploader(Config cfg);
  ~HttpUploader();
  HttpUploader(const HttpUploader&) = delete;
  HttpUploader& operator=(const HttpUploader&) = delete;

  // Consumes `body`. Never retries; a failed upload must restart from scratch.
  Result upload(const std::string& path, UploadBody body);

private:
  struct Impl;
  Impl* p_;
};

}
