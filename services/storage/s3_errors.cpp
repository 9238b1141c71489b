#include "s3_errors.hpp"

#include <aws/core/http/HttpResponse.h>

#include <utility>

BackendError to_backend_error(
    std::string operation,
    const Aws::Client::AWSError<Aws::S3::S3Errors> &error) {
  BackendError backend_error{.operation = std::move(operation),
                             .code = error.GetExceptionName(),
                             .message = error.GetMessage()};

  backend_error.access_denied =
      error.GetErrorType() == Aws::S3::S3Errors::ACCESS_DENIED ||
      error.GetExceptionName() == "AccessDenied";

  const bool network_failure =
      error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION;
  backend_error.timed_out =
      error.GetErrorType() == Aws::S3::S3Errors::REQUEST_TIMEOUT ||
      error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_TIMEOUT ||
      (network_failure &&
       (backend_error.message.find("Timeout") != std::string::npos ||
        backend_error.message.find("timed out") != std::string::npos));

  if (backend_error.code.empty()) {
    if (backend_error.timed_out) {
      backend_error.code = "RequestTimeout";
    } else if (network_failure) {
      backend_error.code = "NetworkConnection";
    } else {
      backend_error.code = "Unknown";
    }
  }
  if (backend_error.timed_out) {
    backend_error.message = "Request timed out: " + backend_error.message;
  }
  return backend_error;
}
