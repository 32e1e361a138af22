#include "trackable_upload/size_parse.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <system_error>
#include <fast_float/fast_float.h>

namespace tu {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
  return s;
}

static std::optional<double> unit_multiplier(std::string_view u) {
  struct Unit { std::string_view name; double mult; };
  static constexpr Unit units[] = {
    {"",    1.0},
    {"b",   1.0},
    {"k",   1024.0},               {"kib", 1024.0},               {"kb", 1e3},
    {"m",   1024.0 * 1024},        {"mib", 1024.0 * 1024},        {"mb", 1e6},
    {"g",   1024.0 * 1024 * 1024}, {"gib", 1024.0 * 1024 * 1024}, {"gb", 1e9},
  };
  for (const auto& x : units) if (ieq(u, x.name)) return x.mult;
  return std::nullopt;
}

std::optional<std::uint64_t> parse_size(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;

  double num = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), num);
  if (ec != std::errc()) return std::nullopt;
  if (!std::isfinite(num) || num < 0.0) return std::nullopt;

  std::string_view suffix = trim(std::string_view(ptr, static_cast<size_t>(s.data() + s.size() - ptr)));
  auto mult = unit_multiplier(suffix);
  if (!mult) return std::nullopt;

  const double bytes = std::floor(num * *mult);
  // 2^64 is exactly representable; anything at or above it overflows
  if (bytes >= 18446744073709551616.0) return std::nullopt;
  return static_cast<std::uint64_t>(bytes);
}

std::string format_bytes(std::uint64_t n) {
  static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double v = static_cast<double>(n);
  int u = 0;
  while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
  char tmp[32];
  if (u == 0) std::snprintf(tmp, sizeof(tmp), "%llu B", static_cast<unsigned long long>(n));
  else        std::snprintf(tmp, sizeof(tmp), "%.2f %s", v, units[u]);
  return tmp;
}

}
