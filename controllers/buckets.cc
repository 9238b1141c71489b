#include "buckets.hpp"

#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

#include <format>
#include <glaze/glaze.hpp>

#include "../utilities/duration.hpp"
#include "common_req_n_resp.hpp"

using api::BucketController;
using drogon::CT_APPLICATION_JSON;
using drogon::HttpResponse;
using drogon::HttpResponsePtr;

namespace {

drogon::HttpStatusCode status_code_for(InspectionErrorKind kind) {
  if (kind == InspectionErrorKind::InvalidFormat) {
    return drogon::k400BadRequest;
  }
  return drogon::k500InternalServerError;
}

HttpResponsePtr make_failure_response(InspectionError error) {
  FailureResponse failure{.reason = std::move(error.reason),
                          .newest_object = std::move(error.newest_object)};
  auto resp = HttpResponse::newHttpResponse(status_code_for(error.kind),
                                            CT_APPLICATION_JSON);
  resp->setBody(glz::write_json(failure).value_or(""));
  return resp;
}

std::string request_id_of(const drogon::HttpRequestPtr &req) {
  return req->attributes()->get<std::string>("request_id");
}

}  // namespace

BucketController::BucketController(
    const BucketInspector &inspector,
    std::optional<std::chrono::seconds> default_max_age)
    : inspector_(inspector), default_max_age_(default_max_age) {}

drogon::Task<> BucketController::get_freshness(
    const drogon::HttpRequestPtr req,
    std::function<void(const drogon::HttpResponsePtr &)> callback,
    std::string bucket_name) {
  try {
    std::optional<std::chrono::seconds> max_age = default_max_age_;

    // Empty and absent max_age both fall back to the default
    const auto &max_age_param = req->getParameter("max_age");
    if (!max_age_param.empty()) {
      auto parsed = utilities::parse_duration(max_age_param);
      if (!parsed) {
        LOG_WARN << "[" << request_id_of(req) << "] " << parsed.error().reason;
        callback(make_failure_response(std::move(parsed.error())));
        co_return;
      }
      max_age = *parsed;
    }

    LOG_INFO << "[" << request_id_of(req) << "] Checking freshness of bucket "
             << bucket_name << ", max age: "
             << (max_age ? std::format("{}s", max_age->count())
                         : std::string("report-only"));

    auto result = co_await inspector_.freshness(bucket_name, max_age);
    if (!result) {
      LOG_WARN << "[" << request_id_of(req) << "] Freshness check of "
               << bucket_name << " failed ("
               << std::string(to_string(result.error().kind))
               << "): " << result.error().reason;
      callback(make_failure_response(std::move(result.error())));
      co_return;
    }

    FreshnessResponse response{.newest_object = result->newest_object,
                               .max_age_seconds = result->max_age_seconds};
    auto resp =
        HttpResponse::newHttpResponse(drogon::k200OK, CT_APPLICATION_JSON);
    resp->setBody(glz::write_json(response).value_or(""));
    callback(resp);
  } catch (const std::exception &e) {
    LOG_ERROR << "Freshness check of " << bucket_name
              << " failed unexpectedly: " << e.what();
    callback(make_failure_response(InspectionError{
        .kind = InspectionErrorKind::Unexpected,
        .reason = std::format("Unexpected error: {}", e.what())}));
  }
  co_return;
}

drogon::Task<> BucketController::get_usage(
    const drogon::HttpRequestPtr req,
    std::function<void(const drogon::HttpResponsePtr &)> callback,
    std::string bucket_name) {
  try {
    LOG_INFO << "[" << request_id_of(req) << "] Checking usage of bucket "
             << bucket_name;

    auto result = co_await inspector_.usage(bucket_name);
    if (!result) {
      LOG_WARN << "[" << request_id_of(req) << "] Usage check of "
               << bucket_name << " failed ("
               << std::string(to_string(result.error().kind))
               << "): " << result.error().reason;
      callback(make_failure_response(std::move(result.error())));
      co_return;
    }

    UsageResponse response{.bucket = std::move(result->bucket),
                           .usage = std::move(result->usage)};
    auto resp =
        HttpResponse::newHttpResponse(drogon::k200OK, CT_APPLICATION_JSON);
    resp->setBody(glz::write_json(response).value_or(""));
    callback(resp);
  } catch (const std::exception &e) {
    LOG_ERROR << "Usage check of " << bucket_name
              << " failed unexpectedly: " << e.what();
    callback(make_failure_response(InspectionError{
        .kind = InspectionErrorKind::Unexpected,
        .reason = std::format("Unexpected error: {}", e.what())}));
  }
  co_return;
}
