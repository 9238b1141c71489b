#ifndef STORAGE_BACKEND_HPP
#define STORAGE_BACKEND_HPP

#include <drogon/utils/coroutine.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <vector>

struct ObjectRecord {
  std::string key;
  // Absent when the backend did not report a size; counts as 0
  std::optional<std::int64_t> size;
  std::chrono::system_clock::time_point last_modified;
};

// All records of a full paginated listing, in arrival order
using BucketSnapshot = std::vector<ObjectRecord>;

struct ListPage {
  std::vector<ObjectRecord> objects;
  // Absent on the last page
  std::optional<std::string> next_continuation_token;
};

struct BackendError {
  std::string operation;
  std::string code;
  std::string message;
  bool access_denied = false;
  bool timed_out = false;

  std::string what() const {
    return std::format("An error occurred ({}) when calling the {} operation: {}",
                       code, operation, message);
  }
};

/**
 * @brief Narrow view of an S3-compatible object store.
 * @note Parameters are taken by value so that the lazily started tasks never
 * hold dangling references.
 */
class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // One "list objects" call. The first page is requested without a token.
  virtual drogon::Task<std::expected<ListPage, BackendError>> list_objects_page(
      std::string bucket_name,
      std::optional<std::string> continuation_token) = 0;

  // Lightweight existence check ("get bucket location")
  virtual drogon::Task<std::expected<void, BackendError>> check_bucket_exists(
      std::string bucket_name) = 0;
};

#endif  // STORAGE_BACKEND_HPP
