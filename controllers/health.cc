#include "health.hpp"

#include <drogon/HttpResponse.h>

#include <glaze/glaze.hpp>

#include "common_req_n_resp.hpp"

using api::HealthController;

void HealthController::get_health(
    const drogon::HttpRequestPtr &req,
    std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
  SimpleStatus status{.status = "ok"};
  auto resp = drogon::HttpResponse::newHttpResponse(
      drogon::k200OK, drogon::CT_APPLICATION_JSON);
  resp->setBody(glz::write_json(status).value_or(""));
  callback(resp);
}
