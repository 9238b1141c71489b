#ifndef INSPECTION_TYPES_HPP
#define INSPECTION_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class InspectionErrorKind {
  InvalidFormat,
  EmptyBucket,
  StaleObject,
  ListPermissionDenied,
  BucketAccessError,
  Unexpected,
};

inline std::string_view to_string(InspectionErrorKind kind) {
  switch (kind) {
    case InspectionErrorKind::InvalidFormat:
      return "InvalidFormat";
    case InspectionErrorKind::EmptyBucket:
      return "EmptyBucket";
    case InspectionErrorKind::StaleObject:
      return "StaleObject";
    case InspectionErrorKind::ListPermissionDenied:
      return "ListPermissionDenied";
    case InspectionErrorKind::BucketAccessError:
      return "BucketAccessError";
    case InspectionErrorKind::Unexpected:
      return "Unexpected";
  }
  return "Unexpected";
}

// Descriptor of the most recently modified object of a bucket
struct NewestObject {
  std::string key;
  std::string last_modified;  // ISO 8601, UTC
  double age_seconds = 0.0;
};

struct InspectionError {
  InspectionErrorKind kind = InspectionErrorKind::Unexpected;
  std::string reason;
  // Only set for StaleObject
  std::optional<NewestObject> newest_object;
};

struct FreshnessResult {
  NewestObject newest_object;
  // Absent in report-only mode
  std::optional<std::int64_t> max_age_seconds;
};

struct BucketUsage {
  std::int64_t object_count = 0;
  std::int64_t total_size_bytes = 0;
  std::string total_size_formatted;
};

struct UsageResult {
  std::string bucket;
  BucketUsage usage;
};

#endif  // INSPECTION_TYPES_HPP
