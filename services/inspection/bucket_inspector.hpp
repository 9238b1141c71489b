#ifndef BUCKET_INSPECTOR_HPP
#define BUCKET_INSPECTOR_HPP

#include <drogon/utils/coroutine.h>

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>

#include "../storage/storage_backend.hpp"
#include "inspection_types.hpp"

/**
 * @brief Read-only inspection of one bucket's listing.
 * Every operation lists the bucket once through the backend and never keeps
 * results between calls, so a single instance can serve concurrent requests.
 */
class BucketInspector {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit BucketInspector(
      StorageBackend& backend,
      Clock clock = [] { return std::chrono::system_clock::now(); });

  /**
   * @brief Lists every object of the bucket, following continuation tokens.
   * Records are kept in the order the backend returned them.
   * @note An access-denied listing is disambiguated with an existence check
   * of the bucket: ListPermissionDenied if the bucket exists,
   * BucketAccessError carrying the existence check error otherwise.
   */
  drogon::Task<std::expected<BucketSnapshot, InspectionError>> list_all(
      std::string bucket_name) const;

  /**
   * @brief Finds the newest object and its age.
   * Fails with StaleObject when max_age is given and the age exceeds it.
   * Without max_age the newest object is only reported.
   */
  drogon::Task<std::expected<FreshnessResult, InspectionError>> freshness(
      std::string bucket_name,
      std::optional<std::chrono::seconds> max_age) const;

  // Object count and total size. An empty bucket is a valid result.
  drogon::Task<std::expected<UsageResult, InspectionError>> usage(
      std::string bucket_name) const;

 private:
  drogon::Task<InspectionError> translate_list_error(std::string bucket_name,
                                                     BackendError error) const;

  StorageBackend& backend_;
  Clock clock_;
};

#endif  // BUCKET_INSPECTOR_HPP
