#ifndef CONVERSION_HPP
#define CONVERSION_HPP

#include <charconv>
#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace convert {

template <class T>
concept Numeric = std::is_arithmetic_v<T>;

// Whole-string conversion. Out of range values yield std::nullopt.
template <Numeric T>
inline std::optional<T> string_to_number(std::string_view sv) {
  std::optional<T> value{{}};  // default init T
  auto ret = std::from_chars(sv.data(), sv.data() + sv.size(), *value);
  if (ret.ec == std::errc{} && ret.ptr == sv.data() + sv.size()) return value;
  return std::nullopt;
}

inline constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

/**
 * @brief Human readable size with two decimals.
 * Binary units: "X.XX GB" from 1024 MB upwards, "X.XX MB" below.
 */
inline std::string format_size(std::int64_t total_bytes) {
  const double size_mb = static_cast<double>(total_bytes) / BYTES_PER_MB;
  const double size_gb = size_mb / 1024.0;

  if (size_gb >= 1.0) {
    return std::format("{:.2f} GB", size_gb);
  }
  return std::format("{:.2f} MB", size_mb);
}

}  // namespace convert

#endif  // CONVERSION_HPP
