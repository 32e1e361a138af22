#include "trackable_upload/upload_config.hpp"
#include "trackable_upload/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int fails = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { ++fails; std::cerr << "[FAIL] " << what << "\n"; }
}

static fs::path write_json(const std::string& name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream(p, std::ios::binary) << body;
  return p;
}

int main(){
  // full config
  {
    const auto p = write_json("tu_cfg_full.json", R"({
      "file": "/tmp/sample.jpeg",
      "url": "http://127.0.0.1:9000/bucket/",
      "key": "tracked_sample.jpeg",
      "method": "POST",
      "chunk_size": "64KiB",
      "connect_timeout_s": 5,
      "read_timeout_s": 30,
      "write_timeout_s": 45,
      "verify_tls": false,
      "progress": false,
      "report": "out/report.json",
      "headers": { "x-amz-acl": "private", "X-Trace": "abc" }
    })");
    tu::UploadConfig c;
    std::string err;
    check(tu::load_config_json(p.string(), c, &err), "full config loads: " + err);
    check(c.file == "/tmp/sample.jpeg", "file");
    check(c.url == "http://127.0.0.1:9000/bucket/", "url");
    check(c.key == "tracked_sample.jpeg", "key");
    check(c.method == "POST", "method");
    check(c.chunk_size == 64 * 1024, "chunk_size from size string");
    check(c.connect_timeout_s == 5 && c.read_timeout_s == 30 && c.write_timeout_s == 45, "timeouts");
    check(!c.verify_tls && !c.progress, "booleans");
    check(c.report_path == "out/report.json", "report");
    check(c.headers.size() == 2 && c.headers[0].first == "x-amz-acl" && c.headers[1].second == "abc", "headers");
    check(tu::validate_config(c, &err), "full config validates: " + err);
    fs::remove(p);
  }

  // numeric chunk size, defaults untouched
  {
    const auto p = write_json("tu_cfg_num.json", R"({"chunk_size": 4096})");
    tu::UploadConfig c;
    std::string err;
    check(tu::load_config_json(p.string(), c, &err), "numeric chunk_size loads: " + err);
    check(c.chunk_size == 4096, "numeric chunk_size");
    check(c.method == "PUT" && c.verify_tls && c.progress, "defaults kept");
    check(!tu::validate_config(c, &err), "missing file/url rejected");
    fs::remove(p);
  }

  // rejected configs
  {
    const char* bad[] = {
      R"({"chunk_size": 0})",
      R"({"chunk_size": "lots"})",
      R"({"unexpected": 1})",
      R"({"read_timeout_s": -3})",
      R"({"verify_tls": "yes"})",
      R"([1, 2, 3])",
      R"({"file": )",
    };
    int i = 0;
    for (const char* body : bad) {
      const auto p = write_json("tu_cfg_bad_" + std::to_string(i++) + ".json", body);
      tu::UploadConfig c;
      std::string err;
      check(!tu::load_config_json(p.string(), c, &err), std::string("rejects ") + body);
      check(!err.empty(), std::string("error text for ") + body);
      fs::remove(p);
    }
  }

  // missing file
  {
    tu::UploadConfig c;
    std::string err;
    check(!tu::load_config_json("/no/such/config.json", c, &err), "missing config file");
  }

  // validation
  {
    tu::UploadConfig c;
    std::string err;
    c.file = "x.bin";
    c.url = "ftp://host/x";
    check(!tu::validate_config(c, &err), "non-http url rejected");
    c.url = "https://host:8443/up/";
    check(tu::validate_config(c, &err), "https url accepted: " + err);
    c.method = "PATCH";
    check(!tu::validate_config(c, &err), "PATCH rejected");
  }

  // url helpers
  {
    auto u = tu::split_url("http://localhost:8080/bucket/dir/");
    check(u && u->scheme_host_port == "http://localhost:8080" && u->path == "/bucket/dir/", "split_url with path");
    auto bare = tu::split_url("https://example.com");
    check(bare && bare->path == "/", "split_url without path");
    check(!tu::split_url("localhost:8080/x"), "split_url needs scheme");
    check(tu::object_path_for("/bucket/", "my file.jpeg") == "/bucket/my%20file.jpeg", "key appended and encoded");
    check(tu::object_path_for("/bucket/obj", "ignored") == "/bucket/obj", "explicit object path kept");
    check(tu::guess_content_type("photo.JPEG") == "image/jpeg", "content type guess");
    check(tu::guess_content_type("blob") == "application/octet-stream", "content type fallback");
    check(tu::guess_content_type("photo\xC3\xA9") == "application/octet-stream", "non-ASCII tail falls back");
    check(tu::guess_content_type("\xC3\xA9t\xC3\xA9.PNG") == "image/png", "non-ASCII stem, extension still matched");
  }

  if (fails) { std::cerr << "[FAIL] upload_config: " << fails << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] upload_config\n";
  return 0;
}
