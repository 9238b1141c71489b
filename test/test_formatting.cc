#include <drogon/drogon_test.h>

#include <chrono>
#include <cstdint>

#include "../utilities/conversion.hpp"
#include "../utilities/time_manipulation.hpp"
#include "helpers.hpp"

DROGON_TEST(FormatSize) {
  constexpr std::int64_t MiB = 1024LL * 1024;
  constexpr std::int64_t GiB = 1024LL * MiB;

  CHECK(convert::format_size(0) == "0.00 MB");
  CHECK(convert::format_size(500) == "0.00 MB");
  CHECK(convert::format_size(2 * MiB) == "2.00 MB");
  CHECK(convert::format_size(2 * GiB) == "2.00 GB");
  // Unit switches exactly at 1 GiB
  CHECK(convert::format_size(GiB) == "1.00 GB");
  CHECK(convert::format_size(GiB - 1) == "1024.00 MB");
  CHECK(convert::format_size(GiB + GiB / 2) == "1.50 GB");
}

DROGON_TEST(Iso8601Timestamps) {
  using namespace std::chrono_literals;

  CHECK(to_iso8601(helpers::T0) == "2024-05-01T12:00:00+00:00");
  CHECK(to_iso8601(helpers::T0 + 1h + 5min + 7s) ==
        "2024-05-01T13:05:07+00:00");
  CHECK(to_iso8601(helpers::T0 + 250ms) == "2024-05-01T12:00:00.250000+00:00");
}
