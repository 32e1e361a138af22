#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tu {

// "4096", "64K", "1.5MiB", "10MB" -> bytes. K/KiB are binary, KB decimal.
// Number parsing goes through fast_float; fractional bytes are truncated.
std::optional<std::uint64_t> parse_size(std::string_view s);

// 1572864 -> "1.50 MiB"
std::string format_bytes(std::uint64_t n);

}
