#include "trackable_upload/upload_config.hpp"
#include "trackable_upload/path_utils.hpp"
#include "trackable_upload/size_parse.hpp"
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tu {

namespace {

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

std::string str_of(simdjson::ondemand::value v) {
  return std::string(std::string_view(v.get_string().value()));
}

int seconds_of(simdjson::ondemand::value v, std::string_view key) {
  const std::int64_t n = v.get_int64().value();
  if (n <= 0 || n > std::numeric_limits<int>::max())
    throw std::out_of_range(std::string(key) + " must be a positive number of seconds");
  return static_cast<int>(n);
}

std::size_t chunk_size_of(simdjson::ondemand::value v) {
  std::uint64_t n = 0;
  if (v.type().value() == simdjson::ondemand::json_type::number) {
    n = v.get_uint64().value();
  } else {
    auto parsed = parse_size(v.get_string().value());
    if (!parsed) throw std::invalid_argument("chunk_size is not a valid size");
    n = *parsed;
  }
  if (n == 0) throw std::invalid_argument("chunk_size must be > 0");
  if (n > std::numeric_limits<std::size_t>::max()) throw std::out_of_range("chunk_size too large");
  return static_cast<std::size_t>(n);
}

}

bool load_config_json(const std::string& path, UploadConfig& cfg, std::string* err_out) {
  simdjson::padded_string json;
  auto load_err = simdjson::padded_string::load(path).get(json);
  if (load_err) {
    return fail(err_out, "cannot read config " + path + ": " + simdjson::error_message(load_err));
  }

  simdjson::ondemand::parser parser;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();

      if      (key == "file")              cfg.file = str_of(v);
      else if (key == "url")               cfg.url = str_of(v);
      else if (key == "key")               cfg.key = str_of(v);
      else if (key == "content_type")      cfg.content_type = str_of(v);
      else if (key == "method")            cfg.method = str_of(v);
      else if (key == "report")            cfg.report_path = str_of(v);
      else if (key == "chunk_size")        cfg.chunk_size = chunk_size_of(v);
      else if (key == "connect_timeout_s") cfg.connect_timeout_s = seconds_of(v, key);
      else if (key == "read_timeout_s")    cfg.read_timeout_s = seconds_of(v, key);
      else if (key == "write_timeout_s")   cfg.write_timeout_s = seconds_of(v, key);
      else if (key == "verify_tls")        cfg.verify_tls = v.get_bool().value();
      else if (key == "progress")          cfg.progress = v.get_bool().value();
      else if (key == "headers") {
        simdjson::ondemand::object hdrs = v.get_object();
        for (auto h : hdrs) {
          std::string name(std::string_view(h.unescaped_key().value()));
          simdjson::ondemand::value hv = h.value();
          cfg.headers.emplace_back(std::move(name), str_of(hv));
        }
      } else {
        return fail(err_out, "unknown config field: [" + std::string(key) + "]");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    return fail(err_out, "invalid config " + path + ": " + e.what());
  } catch (const std::logic_error& e) {
    return fail(err_out, "invalid config " + path + ": " + e.what());
  }
  return true;
}

bool validate_config(const UploadConfig& cfg, std::string* err_out) {
  if (cfg.file.empty()) return fail(err_out, "no file given (--file)");
  if (cfg.url.empty())  return fail(err_out, "no url given (--url)");
  if (!split_url(cfg.url)) return fail(err_out, "url must be http(s)://host[:port][/path]: " + cfg.url);
  if (cfg.method != "PUT" && cfg.method != "POST")
    return fail(err_out, "method must be PUT or POST: " + cfg.method);
  if (cfg.chunk_size == 0) return fail(err_out, "chunk_size must be > 0");
  return true;
}

}
