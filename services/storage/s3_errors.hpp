#ifndef S3_ERRORS_HPP
#define S3_ERRORS_HPP

#include <aws/core/client/AWSError.h>
#include <aws/s3/S3Errors.h>

#include <string>

#include "storage_backend.hpp"

/**
 * @brief Maps an SDK error to a BackendError.
 * access_denied: error type ACCESS_DENIED or exception name "AccessDenied".
 * timed_out: REQUEST_TIMEOUT (type or HTTP 408), or a network failure whose
 * message reports a timeout. The message then starts with "Request timed out: ".
 * An empty exception name is replaced by a code derived from the error type.
 */
BackendError to_backend_error(
    std::string operation,
    const Aws::Client::AWSError<Aws::S3::S3Errors> &error);

#endif  // S3_ERRORS_HPP
