#ifndef COMMON_REQ_N_RESP_HPP
#define COMMON_REQ_N_RESP_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../services/inspection/inspection_types.hpp"

struct SimpleStatus {
  std::string status;
};

struct FailureResponse {
  std::string status{"fail"};
  std::string reason;
  std::optional<NewestObject> newest_object;
};

struct FreshnessResponse {
  std::string status{"ok"};
  NewestObject newest_object;
  std::optional<std::int64_t> max_age_seconds;
};

struct UsageResponse {
  std::string status{"ok"};
  std::string bucket;
  BucketUsage usage;
};

#endif  // COMMON_REQ_N_RESP_HPP
