#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tu {

struct UrlParts {
  std::string scheme_host_port; // "http://host:8080"
  std::string path;             // "/bucket/key", at least "/"
};

// Split an http(s) URL into the client base and the request path.
std::optional<UrlParts> split_url(std::string_view url);

// If `url_path` ends with '/', append the percent-encoded `key`.
std::string object_path_for(std::string_view url_path, std::string_view key);

// Percent-encode everything outside RFC 3986 unreserved chars (and '/').
std::string encode_path(std::string_view s);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess a Content-Type from the file extension.
std::string guess_content_type(std::string_view filename);

std::string basename_of(std::string_view path);

}
