#include "trackable_upload/http_uploader.hpp"
#include "trackable_upload/trackable_stream.hpp"
#include <httplib.h>
#include <algorithm>
#include <memory>
#include <string>

namespace tu {

namespace {

// Shared between the uploader and the (copyable) httplib content provider.
struct BodyState {
  explicit BodyState(UploadBody b) : body(std::move(b)) {}
  UploadBody body;
  std::string abort_reason;
};

httplib::ContentProvider make_provider(std::shared_ptr<BodyState> st) {
  return [st](size_t offset, size_t length, httplib::DataSink& sink) -> bool {
    // the stream cannot rewind, so a restart from another offset is refused
    if (offset != st->body.bytes_sent()) {
      st->abort_reason = "body cannot be replayed from offset " + std::to_string(offset);
      return false;
    }
    std::string chunk;
    switch (st->body.next(chunk)) {
      case PullStatus::Chunk:
        // a source longer than declared is cut at Content-Length
        return sink.write(chunk.data(), std::min(chunk.size(), length));
      case PullStatus::End:
        st->abort_reason = "source ended after " + std::to_string(st->body.bytes_sent()) +
                           " of " + std::to_string(st->body.content_length()) + " bytes";
        return false;
      case PullStatus::Failed:
        st->abort_reason = "transfer error: " + st->body.error().message();
        return false;
    }
    return false;
  };
}

}

struct HttpUploader::Impl {
  Config cfg;
  httplib::Client cli;

  explicit Impl(Config c) : cfg(std::move(c)), cli(cfg.base_url) {
    cli.set_connection_timeout(cfg.connect_timeout_s, 0);
    cli.set_read_timeout(cfg.read_timeout_s, 0);
    cli.set_write_timeout(cfg.write_timeout_s, 0);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    cli.enable_server_certificate_verification(cfg.verify_tls);
#endif
  }
};

HttpUploader::HttpUploader(Config cfg) : p_(new Impl(std::move(cfg))) {}
HttpUploader::~HttpUploader() { delete p_; }

HttpUploader::Result HttpUploader::upload(const std::string& path, UploadBody body) {
  Result r;
  if (!p_->cli.is_valid()) {
    r.error = "invalid client for " + p_->cfg.base_url;
    return r;
  }

  const bool is_put = p_->cfg.method == "PUT";
  if (!is_put && p_->cfg.method != "POST") {
    r.error = "unsupported method: " + p_->cfg.method;
    return r;
  }

  httplib::Headers headers;
  for (const auto& h : p_->cfg.headers) headers.emplace(h.first, h.second);

  auto st = std::make_shared<BodyState>(std::move(body));
  const auto length = static_cast<size_t>(st->body.content_length());

  auto res = is_put
      ? p_->cli.Put(path, headers, length, make_provider(st), p_->cfg.content_type)
      : p_->cli.Post(path, headers, length, make_provider(st), p_->cfg.content_type);

  // a longer-than-declared source is cut at Content-Length by the provider
  r.bytes_sent = std::min<std::uint64_t>(st->body.bytes_sent(), length);
  if (!res) {
    r.error = st->abort_reason.empty() ? httplib::to_string(res.error()) : st->abort_reason;
    return r;
  }
  r.status = res->status;
  r.body = res->body;
  r.ok = res->status >= 200 && res->status < 300;
  if (!r.ok) r.error = "HTTP " + std::to_string(res->status);
  return r;
}

}
