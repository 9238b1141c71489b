#include <drogon/HttpMiddleware.h>
#include <drogon/drogon.h>

#include <string>

#include "../utilities/uuid_generator.hpp"

/**
 * @brief Tags every request with an id, kept in the "request_id" attribute and
 * echoed in the X-Request-Id response header. A caller supplied id is reused.
 */
class RequestIdMiddleware
    : public drogon::HttpCoroMiddleware<RequestIdMiddleware> {
 public:
  RequestIdMiddleware() = default;

  drogon::Task<drogon::HttpResponsePtr> invoke(
      const drogon::HttpRequestPtr &req,
      drogon::MiddlewareNextAwaiter &&next) override {
    std::string request_id = req->getHeader("X-Request-Id");
    if (request_id.empty()) {
      request_id = UuidGenerator::generate_uuid();
    }
    req->attributes()->insert("request_id", request_id);

    LOG_DEBUG << "[" << request_id << "] " << req->getMethodString() << " "
              << req->getPath();

    auto resp = co_await next;
    resp->addHeader("X-Request-Id", request_id);
    co_return resp;
  }
};
