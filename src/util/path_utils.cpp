#include "trackable_upload/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace tu {

std::optional<UrlParts> split_url(std::string_view url) {
  const auto sep = url.find("://");
  if (sep == std::string_view::npos) return std::nullopt;
  const auto scheme = url.substr(0, sep);
  if (scheme != "http" && scheme != "https") return std::nullopt;

  const auto host_start = sep + 3;
  const auto slash = url.find('/', host_start);
  UrlParts out;
  if (slash == std::string_view::npos) {
    out.scheme_host_port = std::string(url);
    out.path = "/";
  } else {
    out.scheme_host_port = std::string(url.substr(0, slash));
    out.path = std::string(url.substr(slash));
  }
  if (out.scheme_host_port.size() <= host_start) return std::nullopt; // no host
  return out;
}

std::string encode_path(std::string_view s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out += '%'; out += hex[c >> 4]; out += hex[c & 0xF];
    }
  }
  return out;
}

std::string object_path_for(std::string_view url_path, std::string_view key) {
  std::string p(url_path.empty() ? "/" : url_path);
  if (p.back() == '/' && !key.empty()) p += encode_path(key);
  return p;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string guess_content_type(std::string_view name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.data() + (m - n),
                                [](char a, char b){
                                  return std::tolower(static_cast<unsigned char>(a)) ==
                                         std::tolower(static_cast<unsigned char>(b));
                                });
  };
  if (ends(".jpeg") || ends(".jpg")) return "image/jpeg";
  if (ends(".png"))  return "image/png";
  if (ends(".gif"))  return "image/gif";
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".js"))   return "application/javascript; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  if (ends(".csv"))  return "text/csv";
  if (ends(".pdf"))  return "application/pdf";
  if (ends(".zip"))  return "application/zip";
  if (ends(".gz"))   return "application/gzip";
  return "application/octet-stream";
}

std::string basename_of(std::string_view path) {
  return std::filesystem::path(std::string(path)).filename().string();
}

}
