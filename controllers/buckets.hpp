#ifndef BUCKETS_CONTROLLER_HPP
#define BUCKETS_CONTROLLER_HPP

#include <drogon/HttpController.h>

#include <chrono>
#include <optional>
#include <string>

#include "../services/inspection/bucket_inspector.hpp"

namespace api {

/**
 * @brief Bucket freshness and usage endpoints
 * @note Not auto-created: registered with app().registerController() so the
 * inspector can be injected.
 */
class BucketController
    : public drogon::HttpController<BucketController, false> {
 public:
  BucketController(const BucketInspector &inspector,
                   std::optional<std::chrono::seconds> default_max_age);

  METHOD_LIST_BEGIN
  ADD_METHOD_TO(BucketController::get_freshness,
                "/buckets/{bucket_name}/freshness", drogon::Get,
                "RequestIdMiddleware");
  ADD_METHOD_TO(BucketController::get_usage, "/buckets/{bucket_name}/usage",
                drogon::Get, "RequestIdMiddleware");
  METHOD_LIST_END

  drogon::Task<> get_freshness(
      const drogon::HttpRequestPtr req,
      std::function<void(const drogon::HttpResponsePtr &)> callback,
      std::string bucket_name);

  drogon::Task<> get_usage(
      const drogon::HttpRequestPtr req,
      std::function<void(const drogon::HttpResponsePtr &)> callback,
      std::string bucket_name);

 private:
  const BucketInspector &inspector_;
  // std::nullopt means report-only when max_age is omitted
  std::optional<std::chrono::seconds> default_max_age_;
};

}  // namespace api

#endif  // BUCKETS_CONTROLLER_HPP
