#include "trackable_upload/http_uploader.hpp"
#include "trackable_upload/metrics.hpp"
#include "trackable_upload/path_utils.hpp"
#include "trackable_upload/progress_bar.hpp"
#include "trackable_upload/size_parse.hpp"
#include "trackable_upload/trackable_stream.hpp"
#include "trackable_upload/upload_config.hpp"
#include "trackable_upload/upload_report.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

enum Exit { kOk = 0, kUsage = 1, kOpen = 2, kTransfer = 3, kReport = 4 };

void usage(std::ostream& o) {
  o <<
    "Usage: trackable-upload --url=URL --file=PATH [--config=FILE.json]\n"
    "                        [--key=NAME] [--chunk-size=SIZE] [--content-type=TYPE]\n"
    "                        [--method=PUT|POST] [--header=Name:Value]... [--timeout=SEC]\n"
    "                        [--report=FILE.json] [--insecure] [--no-progress]\n"
    "SIZE accepts suffixes: K/KiB, KB, M/MiB, MB, G/GiB, GB (e.g. 64K, 1.5MiB).\n";
}

// --config is applied first so the remaining flags override it.
bool parse_cli(int argc, char** argv, tu::UploadConfig& c, bool& help, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      if (!tu::load_config_json(a.substr(9), c, &err)) return false;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      try {
        std::size_t used = 0;
        *out = std::stoi(v, &used);
        if (used != v.size()) *out = -1;
      } catch (const std::exception&) { *out = -1; }
      if (*out <= 0) throw std::invalid_argument(std::string(pfx) + " expects a positive integer");
      return true;
    };

    std::string v;
    if (a.rfind("--config=", 0) == 0) continue;
    if (eat("--url=", &c.url)) continue;
    if (eat("--file=", &c.file)) continue;
    if (a == "--file" && i+1 < argc) { c.file = argv[++i]; continue; }
    if (eat("--key=", &c.key)) continue;
    if (eat("--content-type=", &c.content_type)) continue;
    if (eat("--method=", &c.method)) continue;
    if (eat("--report=", &c.report_path)) continue;
    if (eat("--chunk-size=", &v)) {
      auto n = tu::parse_size(v);
      if (!n || *n == 0) { err = "invalid --chunk-size: " + v; return false; }
      c.chunk_size = static_cast<std::size_t>(*n);
      continue;
    }
    if (eat("--header=", &v)) {
      auto colon = v.find(':');
      if (colon == std::string::npos || colon == 0) { err = "invalid --header (want Name:Value): " + v; return false; }
      std::string value = v.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') value.erase(0, 1);
      c.headers.emplace_back(v.substr(0, colon), value);
      continue;
    }
    try {
      int secs = 0;
      if (eat_i("--timeout=", &secs)) { c.read_timeout_s = c.write_timeout_s = secs; continue; }
      if (eat_i("--connect-timeout=", &c.connect_timeout_s)) continue;
    } catch (const std::invalid_argument& e) {
      err = e.what();
      return false;
    }
    if (a == "--insecure")    { c.verify_tls = false; continue; }
    if (a == "--no-progress") { c.progress = false; continue; }
    if (a == "-h" || a == "--help") { help = true; return true; }
    err = "unknown argument: " + a;
    return false;
  }
  return true;
}

}

int main(int argc, char** argv) {
  tu::UploadConfig cfg;
  bool help = false;
  std::string err;
  if (!parse_cli(argc, argv, cfg, help, err)) {
    std::cerr << "[upload] " << err << "\n";
    usage(std::cerr);
    return kUsage;
  }
  if (help) { usage(std::cout); return kOk; }
  if (!tu::validate_config(cfg, &err)) {
    std::cerr << "[upload] " << err << "\n";
    usage(std::cerr);
    return kUsage;
  }

  const auto url = *tu::split_url(cfg.url);
  const std::string key = cfg.key.empty() ? tu::basename_of(cfg.file) : cfg.key;
  const std::string path = tu::object_path_for(url.path, key);
  const std::string content_type =
      cfg.content_type.empty() ? tu::guess_content_type(cfg.file) : cfg.content_type;

  tu::TransferMetrics metrics;

  // --- open source
  metrics.start_stage("open");
  std::error_code ec;
  auto stream = tu::TrackableStream::from_file(cfg.file, ec);
  metrics.end_stage("open");
  if (!stream) {
    std::cerr << "[upload] cannot open " << cfg.file << ": " << ec.message() << "\n";
    return kOpen;
  }
  stream->set_chunk_size(cfg.chunk_size);

  const std::uint64_t total = stream->total_size();
  std::unique_ptr<tu::ProgressBar> bar;
  if (cfg.progress) bar = std::make_unique<tu::ProgressBar>(total, std::cerr);

  metrics.start(total);
  stream->set_callback([&metrics, &bar](std::uint64_t tot, std::uint64_t sent, std::uint64_t n){
    metrics.on_chunk(sent, n);
    if (bar) {
      bar->inc(n);
      if (sent == tot) bar->finish();
    }
  });

  std::cout << "[upload] " << cfg.method << " " << cfg.file << " (" << tu::format_bytes(total)
            << ") -> " << url.scheme_host_port << path << "\n";

  // --- transfer
  tu::HttpUploader::Config ucfg;
  ucfg.base_url = url.scheme_host_port;
  ucfg.method = cfg.method;
  ucfg.content_type = content_type;
  ucfg.headers = cfg.headers;
  ucfg.connect_timeout_s = cfg.connect_timeout_s;
  ucfg.read_timeout_s = cfg.read_timeout_s;
  ucfg.write_timeout_s = cfg.write_timeout_s;
  ucfg.verify_tls = cfg.verify_tls;

  tu::HttpUploader uploader(ucfg);
  metrics.start_stage("transfer");
  auto res = uploader.upload(path, std::move(*stream).to_upload_body());
  metrics.end_stage("transfer");
  if (bar && !bar->finished()) bar->finish();

  const tu::TransferStats stats = metrics.snapshot();
  if (res.ok) {
    std::cout << "[upload] ok: HTTP " << res.status << ", " << res.bytes_sent << " bytes in "
              << stats.chunks << " chunks, " << stats.wall_ms << " ms ("
              << stats.throughput_mb_s << " MB/s)\n";
  } else {
    std::cerr << "[upload] failed after " << res.bytes_sent << " of " << total
              << " bytes: " << res.error << "\n";
  }

  // --- report
  if (!cfg.report_path.empty()) {
    tu::UploadReportPayload p;
    p.ok = res.ok;
    p.http_status = res.status;
    p.error = res.error;
    p.file_size = total;
    p.bytes_sent = res.bytes_sent;
    p.chunks = stats.chunks;
    p.chunk_size = cfg.chunk_size;
    p.wall_time_ms = stats.wall_ms;
    p.throughput_mb_s = stats.throughput_mb_s;
    for (const auto& s : stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
    p.series = stats.series;
    p.filename = cfg.file;
    p.url = url.scheme_host_port + path;
    p.content_type = content_type;
    if (!tu::write_upload_report(cfg.report_path, p, &err)) {
      std::cerr << "[upload] report: " << err << "\n";
      return res.ok ? kReport : kTransfer;
    }
  }

  return res.ok ? kOk : kTransfer;
}
