#ifndef TIME_MANIPULATION_HPP
#define TIME_MANIPULATION_HPP

#include <chrono>
#include <format>
#include <string>

/**
 * ISO 8601 UTC timestamp with explicit offset
 * Format: YYYY-MM-DDTHH:MM:SS[.ffffff]+00:00
 * Microseconds are only written when the sub-second part is non-zero.
 */
inline std::string to_iso8601(std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds);
  if (us.count() == 0) {
    return std::format("{:%FT%T}+00:00", seconds);
  }
  return std::format("{:%FT%T}.{:06}+00:00", seconds, us.count());
}

#endif  // TIME_MANIPULATION_HPP
