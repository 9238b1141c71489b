#pragma once
#include <drogon/HttpController.h>

namespace api {

// Liveness endpoint for container health checks. Never touches the backend.
class HealthController : public drogon::HttpController<HealthController> {
 public:
  METHOD_LIST_BEGIN
  ADD_METHOD_TO(HealthController::get_health, "/health", drogon::Get);
  METHOD_LIST_END

  static void get_health(
      const drogon::HttpRequestPtr &req,
      std::function<void(const drogon::HttpResponsePtr &)> &&callback);
};

}  // namespace api
