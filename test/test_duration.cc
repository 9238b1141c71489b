#include <drogon/drogon_test.h>

#include <array>
#include <string>

#include "../utilities/duration.hpp"

using utilities::parse_duration;

DROGON_TEST(DurationParserUnits) {
  auto hours = parse_duration("24h");
  REQUIRE(hours.has_value());
  CHECK(hours->count() == 86400);

  auto minutes = parse_duration("30m");
  REQUIRE(minutes.has_value());
  CHECK(minutes->count() == 1800);

  auto days = parse_duration("2d");
  REQUIRE(days.has_value());
  CHECK(days->count() == 172800);

  auto zero = parse_duration("0h");
  REQUIRE(zero.has_value());
  CHECK(zero->count() == 0);

  auto leading_zeros = parse_duration("007m");
  REQUIRE(leading_zeros.has_value());
  CHECK(leading_zeros->count() == 420);
}

DROGON_TEST(DurationParserDefault) {
  auto empty = parse_duration("");
  auto explicit_default = parse_duration("24h");
  REQUIRE(empty.has_value());
  REQUIRE(explicit_default.has_value());
  CHECK(*empty == *explicit_default);
  CHECK(*empty == utilities::DEFAULT_MAX_AGE);
}

DROGON_TEST(DurationParserRejectsMalformed) {
  const std::array<std::string, 13> tokens = {
      "h",   "24",   "24H",  "24s", "1.5h", "-1h",  " 24h",
      "24h ", "24hm", "h24", "+1h", "24h\n", "1 h"};

  for (const auto& token : tokens) {
    auto parsed = parse_duration(token);
    CHECK(!parsed.has_value());
    if (!parsed) {
      CHECK(parsed.error().kind == InspectionErrorKind::InvalidFormat);
      CHECK(parsed.error().reason.starts_with("Invalid duration format: " +
                                              token));
    }
  }
}

DROGON_TEST(DurationParserRejectsOverflow) {
  // Does not fit in 64 bits at all
  auto huge = parse_duration("99999999999999999999h");
  REQUIRE(!huge.has_value());
  CHECK(huge.error().kind == InspectionErrorKind::InvalidFormat);

  // Fits, but not once converted to seconds
  auto wrapped = parse_duration("9223372036854775807d");
  REQUIRE(!wrapped.has_value());
  CHECK(wrapped.error().kind == InspectionErrorKind::InvalidFormat);

  // Rejected up front, long input must not reach the regex engine
  const std::string long_digits(100000, '9');
  auto oversized = parse_duration(long_digits + "h");
  REQUIRE(!oversized.has_value());
  CHECK(oversized.error().kind == InspectionErrorKind::InvalidFormat);
  CHECK(oversized.error().reason.find("too long") != std::string::npos);

  auto oversized_zeros = parse_duration(std::string(100000, '0') + "1m");
  REQUIRE(!oversized_zeros.has_value());
  CHECK(oversized_zeros.error().kind == InspectionErrorKind::InvalidFormat);

  // Largest minute count that still fits
  auto largest = parse_duration("153722867280912930m");
  REQUIRE(largest.has_value());
  CHECK(largest->count() == 153722867280912930LL * 60);
}
