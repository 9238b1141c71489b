#include "bucket_inspector.hpp"

#include <drogon/drogon.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <limits>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "../../utilities/conversion.hpp"
#include "../../utilities/time_manipulation.hpp"

namespace {

constexpr std::string_view LIST_PERMISSION_REQUIRED =
    "The 's3:ListBucket' permission is required.";

void prefix_permission_reason(InspectionError& error,
                              std::string_view prefix) {
  if (error.kind == InspectionErrorKind::ListPermissionDenied) {
    error.reason = std::format("{} {}", prefix, error.reason);
  }
}

}  // namespace

BucketInspector::BucketInspector(StorageBackend& backend, Clock clock)
    : backend_(backend), clock_(std::move(clock)) {}

drogon::Task<std::expected<BucketSnapshot, InspectionError>>
BucketInspector::list_all(std::string bucket_name) const {
  BucketSnapshot snapshot;
  std::optional<std::string> continuation_token;
  std::unordered_set<std::string> seen_tokens;
  std::size_t page_number = 0;

  try {
    do {
      auto page =
          co_await backend_.list_objects_page(bucket_name, continuation_token);
      if (!page) {
        co_return std::unexpected(
            co_await translate_list_error(bucket_name, std::move(page.error())));
      }

      ++page_number;
      LOG_DEBUG << "Bucket " << bucket_name << " page " << page_number << ": "
                << page->objects.size() << " objects, truncated: "
                << page->next_continuation_token.has_value();

      snapshot.insert(snapshot.end(),
                      std::make_move_iterator(page->objects.begin()),
                      std::make_move_iterator(page->objects.end()));
      continuation_token = std::move(page->next_continuation_token);

      // A backend handing out the same token twice would never terminate
      if (continuation_token &&
          !seen_tokens.insert(*continuation_token).second) {
        LOG_ERROR << "Repeated continuation token while listing "
                  << bucket_name;
        co_return std::unexpected(InspectionError{
            .kind = InspectionErrorKind::BucketAccessError,
            .reason = std::format("Error accessing bucket: listing of '{}' "
                                  "returned a repeated continuation token",
                                  bucket_name)});
      }
    } while (continuation_token);
  } catch (const std::exception& e) {
    LOG_ERROR << "Unexpected error listing bucket " << bucket_name << ": "
              << e.what();
    co_return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::Unexpected,
        .reason = std::format("Unexpected error: {}", e.what())});
  }

  LOG_INFO << "Listed " << snapshot.size() << " objects in " << page_number
           << " page(s) from bucket " << bucket_name;
  co_return snapshot;
}

drogon::Task<InspectionError> BucketInspector::translate_list_error(
    std::string bucket_name, BackendError error) const {
  if (!error.access_denied) {
    LOG_WARN << "Listing bucket " << bucket_name << " failed: " << error.what();
    co_return InspectionError{
        .kind = InspectionErrorKind::BucketAccessError,
        .reason = std::format("Error accessing bucket: {}", error.what())};
  }

  // Denied listing and missing bucket look the same from the list call alone
  auto exists = co_await backend_.check_bucket_exists(bucket_name);
  if (exists) {
    LOG_WARN << "Bucket " << bucket_name
             << " exists but listing its objects is denied";
    co_return InspectionError{
        .kind = InspectionErrorKind::ListPermissionDenied,
        .reason = std::string(LIST_PERMISSION_REQUIRED)};
  }

  LOG_WARN << "Existence check of bucket " << bucket_name
           << " failed: " << exists.error().what();
  co_return InspectionError{
      .kind = InspectionErrorKind::BucketAccessError,
      .reason =
          std::format("Error accessing bucket: {}", exists.error().what())};
}

drogon::Task<std::expected<FreshnessResult, InspectionError>>
BucketInspector::freshness(std::string bucket_name,
                           std::optional<std::chrono::seconds> max_age) const {
  auto snapshot = co_await list_all(bucket_name);
  if (!snapshot) {
    InspectionError error = std::move(snapshot.error());
    prefix_permission_reason(error, "Cannot check newest object age.");
    co_return std::unexpected(std::move(error));
  }

  if (snapshot->empty()) {
    LOG_WARN << "Bucket " << bucket_name << " is empty";
    co_return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::EmptyBucket,
        .reason = std::format("Bucket '{}' is empty", bucket_name)});
  }

  // First of the records sharing the maximum timestamp
  const auto newest = std::max_element(
      snapshot->begin(), snapshot->end(),
      [](const ObjectRecord& lhs, const ObjectRecord& rhs) {
        return lhs.last_modified < rhs.last_modified;
      });

  const auto now = clock_();
  const auto age = now - newest->last_modified;

  NewestObject descriptor{
      .key = newest->key,
      .last_modified = to_iso8601(newest->last_modified),
      .age_seconds = std::chrono::duration<double>(age).count()};

  if (max_age && age > *max_age) {
    LOG_WARN << "Newest object " << descriptor.key << " in bucket "
             << bucket_name << " is " << descriptor.age_seconds
             << "s old, max age " << max_age->count() << "s";
    co_return std::unexpected(InspectionError{
        .kind = InspectionErrorKind::StaleObject,
        .reason = std::format(
            "Newest object is too old ({:.0f} seconds, max age: {} seconds)",
            descriptor.age_seconds, max_age->count()),
        .newest_object = std::move(descriptor)});
  }

  FreshnessResult result{.newest_object = std::move(descriptor)};
  if (max_age) {
    result.max_age_seconds = max_age->count();
  }
  co_return result;
}

drogon::Task<std::expected<UsageResult, InspectionError>>
BucketInspector::usage(std::string bucket_name) const {
  auto snapshot = co_await list_all(bucket_name);
  if (!snapshot) {
    InspectionError error = std::move(snapshot.error());
    prefix_permission_reason(error, "Cannot check bucket usage.");
    co_return std::unexpected(std::move(error));
  }

  std::int64_t total_size = 0;
  for (const auto& object : *snapshot) {
    const std::int64_t size = object.size.value_or(0);
    if (size > 0 &&
        total_size > std::numeric_limits<std::int64_t>::max() - size) {
      LOG_ERROR << "Total size of bucket " << bucket_name
                << " overflows a 64-bit byte count";
      co_return std::unexpected(InspectionError{
          .kind = InspectionErrorKind::BucketAccessError,
          .reason = std::format("Error accessing bucket: total size of '{}' "
                                "overflows a 64-bit byte count",
                                bucket_name)});
    }
    total_size += size;
  }

  co_return UsageResult{
      .bucket = bucket_name,
      .usage = BucketUsage{
          .object_count = static_cast<std::int64_t>(snapshot->size()),
          .total_size_bytes = total_size,
          .total_size_formatted = convert::format_size(total_size)}};
}
