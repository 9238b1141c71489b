#ifndef S3_SERVICE_HPP
#define S3_SERVICE_HPP

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include <drogon/utils/coroutine.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "storage_backend.hpp"

/**
 * @brief StorageBackend over the AWS SDK S3 client.
 * Endpoint, credentials and timeouts are read from the environment and the
 * application config once, at construction. Requires Aws::InitAPI.
 */
class S3Service : public StorageBackend {
 public:
  S3Service();

  drogon::Task<std::expected<ListPage, BackendError>> list_objects_page(
      std::string bucket_name,
      std::optional<std::string> continuation_token) override;

  drogon::Task<std::expected<void, BackendError>> check_bucket_exists(
      std::string bucket_name) override;

 private:
  std::unique_ptr<Aws::S3::S3Client> s3_client_;
};

#endif  // S3_SERVICE_HPP
