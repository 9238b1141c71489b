#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <drogon/drogon.h>

#include <glaze/glaze.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../services/inspection/bucket_inspector.hpp"
#include "../services/storage/storage_backend.hpp"

namespace helpers {

inline constexpr std::uint16_t TEST_PORT = 5556;
inline const std::string TEST_SERVER = "http://127.0.0.1:5556";

// 2024-05-01T12:00:00Z
inline const std::chrono::system_clock::time_point T0 =
    std::chrono::sys_days{std::chrono::year{2024} / 5 / 1} +
    std::chrono::hours(12);

/**
 * @brief Decodes a response body, ignoring keys T does not declare.
 * @return glz::expected holding the value or the glaze error context
 */
template <glz::read_supported<glz::JSON> T>
[[nodiscard]] inline glz::expected<T, glz::error_ctx> read_response_json(
    std::string_view body) {
  T value{};
  const glz::error_ctx ec =
      glz::read<glz::opts{.error_on_unknown_keys = false}>(value, body);
  if (ec) {
    return glz::unexpected<glz::error_ctx>(ec);
  }
  return value;
}

inline BucketInspector::Clock fixed_clock(
    std::chrono::system_clock::time_point now) {
  return [now] { return now; };
}

inline ObjectRecord object(std::string key, std::optional<std::int64_t> size,
                           std::chrono::system_clock::time_point modified) {
  return ObjectRecord{
      .key = std::move(key), .size = size, .last_modified = modified};
}

struct BucketFixture {
  std::vector<std::vector<ObjectRecord>> pages;
  std::optional<BackendError> list_error;
  std::optional<BackendError> existence_error;
  bool throw_on_list = false;
  // Every page points back at the same token
  bool repeat_token = false;
};

inline BackendError access_denied(std::string operation) {
  return BackendError{.operation = std::move(operation),
                      .code = "AccessDenied",
                      .message = "Access Denied",
                      .access_denied = true};
}

inline BackendError no_such_bucket(std::string operation) {
  return BackendError{.operation = std::move(operation),
                      .code = "NoSuchBucket",
                      .message = "The specified bucket does not exist"};
}

/**
 * In-memory StorageBackend. Pages are handed out with "page-<n>" continuation
 * tokens; unknown buckets behave like a missing bucket.
 */
class FakeStorageBackend : public StorageBackend {
 public:
  void add_bucket(const std::string& name, BucketFixture fixture) {
    std::lock_guard lock(mutex_);
    buckets_[name] = std::move(fixture);
  }

  drogon::Task<std::expected<ListPage, BackendError>> list_objects_page(
      std::string bucket_name,
      std::optional<std::string> continuation_token) override {
    std::lock_guard lock(mutex_);
    requested_tokens_.push_back(continuation_token.value_or(""));

    auto it = buckets_.find(bucket_name);
    if (it == buckets_.end()) {
      co_return std::unexpected(no_such_bucket("ListObjectsV2"));
    }
    const BucketFixture& fixture = it->second;
    if (fixture.throw_on_list) {
      throw std::runtime_error("connection pool exhausted");
    }
    if (fixture.list_error) {
      co_return std::unexpected(*fixture.list_error);
    }

    std::size_t index = 0;
    if (continuation_token) {
      index = std::stoul(continuation_token->substr(5));
    }

    ListPage page;
    if (index < fixture.pages.size()) {
      page.objects = fixture.pages[index];
    }
    if (fixture.repeat_token) {
      page.next_continuation_token = "page-1";
    } else if (index + 1 < fixture.pages.size()) {
      page.next_continuation_token = std::format("page-{}", index + 1);
    }
    co_return page;
  }

  drogon::Task<std::expected<void, BackendError>> check_bucket_exists(
      std::string bucket_name) override {
    std::lock_guard lock(mutex_);
    ++existence_checks_;

    auto it = buckets_.find(bucket_name);
    if (it == buckets_.end()) {
      co_return std::unexpected(no_such_bucket("GetBucketLocation"));
    }
    if (it->second.existence_error) {
      co_return std::unexpected(*it->second.existence_error);
    }
    co_return std::expected<void, BackendError>{};
  }

  std::vector<std::string> requested_tokens() const {
    std::lock_guard lock(mutex_);
    return requested_tokens_;
  }

  int existence_checks() const {
    std::lock_guard lock(mutex_);
    return existence_checks_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, BucketFixture> buckets_;
  std::vector<std::string> requested_tokens_;
  int existence_checks_ = 0;
};

}  // namespace helpers

#endif  // TEST_HELPERS_HPP
