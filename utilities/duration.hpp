#ifndef DURATION_HPP
#define DURATION_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <regex>
#include <string>
#include <string_view>

#include "../services/inspection/inspection_types.hpp"
#include "conversion.hpp"

namespace utilities {

inline constexpr std::chrono::seconds DEFAULT_MAX_AGE = std::chrono::hours(24);
// 19 digits cover any int64_t value, the rest is slack for leading zeros.
// std::regex recurses per character, so longer input must never reach it.
inline constexpr std::size_t MAX_DURATION_TOKEN_LENGTH = 24;

/**
 * @brief Parses compact duration tokens like "24h", "30m" or "2d".
 * An empty token yields DEFAULT_MAX_AGE.
 * @return the span in seconds, or an InvalidFormat error for tokens that do
 * not match ^\d+[hmd]$ or that do not fit in 64-bit seconds.
 */
[[nodiscard]] inline std::expected<std::chrono::seconds, InspectionError>
parse_duration(std::string_view token) {
  if (token.empty()) {
    return DEFAULT_MAX_AGE;
  }

  if (token.size() > MAX_DURATION_TOKEN_LENGTH) {
    return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::InvalidFormat,
        .reason = std::format("Invalid duration format: token of {} "
                              "characters is too long. Use format like "
                              "'24h', '60m', or '2d'",
                              token.size())});
  }

  static const std::regex pattern(R"(^(\d+)([hmd])$)");
  const std::string input(token);
  std::smatch match;
  if (!std::regex_match(input, match, pattern)) {
    return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::InvalidFormat,
        .reason = std::format("Invalid duration format: {}. Use format like "
                              "'24h', '60m', or '2d'",
                              input)});
  }

  std::int64_t unit_seconds = 3600;
  switch (match.str(2).front()) {
    case 'm':
      unit_seconds = 60;
      break;
    case 'd':
      unit_seconds = 86400;
      break;
    default:
      break;
  }

  auto value = convert::string_to_number<std::int64_t>(match.str(1));
  if (!value ||
      *value > std::numeric_limits<std::int64_t>::max() / unit_seconds) {
    return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::InvalidFormat,
        .reason = std::format("Invalid duration format: {}. Value is out of "
                              "range",
                              input)});
  }

  return std::chrono::seconds(*value * unit_seconds);
}

}  // namespace utilities

#endif  // DURATION_HPP
