#include "s3_service.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/AsyncCallerContext.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/utils/DateTime.h>
#include <aws/s3/model/GetBucketLocationRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <drogon/drogon.h>

#include "../../config/config.hpp"
#include "async_outcome.hpp"
#include "s3_errors.hpp"

S3Service::S3Service() {
  Aws::Client::ClientConfiguration client_config;

  // Environment first, then Drogon's custom config
  std::string endpoint = config::get_env_or_config_value(
      "S3_ENDPOINT", "s3_endpoint", config::DEFAULT_S3_ENDPOINT);
  std::string access_key =
      config::get_env_or_config_value("S3_KEY", "s3_access_key", "");
  std::string secret_key =
      config::get_env_or_config_value("S3_SECRET", "s3_secret_key", "");

  client_config.endpointOverride = endpoint;
  client_config.scheme = endpoint.starts_with("http://")
                             ? Aws::Http::Scheme::HTTP
                             : Aws::Http::Scheme::HTTPS;
  client_config.region =
      config::get_config_value("s3_region", config::DEFAULT_S3_REGION);
  client_config.verifySSL = config::get_config_bool("s3_verify_ssl", true);
  client_config.requestTimeoutMs = static_cast<long>(
      config::get_config_int("s3_request_timeout_ms", 30000));
  client_config.connectTimeoutMs = static_cast<long>(
      config::get_config_int("s3_connect_timeout_ms", 5000));
  // Failures surface to the caller immediately
  client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("S3Service", 0);

  LOG_INFO << "Initializing S3 client with endpoint: " << endpoint
           << ", request timeout: " << client_config.requestTimeoutMs << "ms";

  if (access_key.empty() || secret_key.empty()) {
    LOG_WARN << "No S3 credentials configured, using the default AWS "
                "credentials provider chain";
    s3_client_ = std::make_unique<Aws::S3::S3Client>(
        client_config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, false);
  } else {
    s3_client_ = std::make_unique<Aws::S3::S3Client>(
        Aws::Auth::AWSCredentials(access_key, secret_key), client_config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, false);
  }
}

drogon::Task<std::expected<ListPage, BackendError>>
S3Service::list_objects_page(std::string bucket_name,
                             std::optional<std::string> continuation_token) {
  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(bucket_name);
  if (continuation_token) {
    request.SetContinuationToken(*continuation_token);
  }

  // Completes on an SDK executor thread, resumes on this request's loop
  auto outcome =
      co_await AsyncOutcomeAwaiter<Aws::S3::Model::ListObjectsV2Outcome>(
          [this, &request](auto complete) {
            s3_client_->ListObjectsV2Async(
                request,
                [complete](const Aws::S3::S3Client *,
                           const Aws::S3::Model::ListObjectsV2Request &,
                           const Aws::S3::Model::ListObjectsV2Outcome &outcome,
                           const std::shared_ptr<
                               const Aws::Client::AsyncCallerContext> &) {
                  complete(outcome);
                });
          });
  if (!outcome.IsSuccess()) {
    co_return std::unexpected(
        to_backend_error("ListObjectsV2", outcome.GetError()));
  }

  const auto &result = outcome.GetResult();
  ListPage page;
  page.objects.reserve(result.GetContents().size());

  for (const auto &object : result.GetContents()) {
    if (object.GetKey().empty() ||
        !object.GetLastModified().WasParseSuccessful()) {
      LOG_WARN << "Skipping listed object without key or timestamp in bucket "
               << bucket_name;
      continue;
    }
    page.objects.emplace_back(ObjectRecord{
        .key = object.GetKey(),
        .size = object.SizeHasBeenSet()
                    ? std::optional<std::int64_t>(object.GetSize())
                    : std::nullopt,
        .last_modified = object.GetLastModified().UnderlyingTimestamp()});
  }

  if (result.GetIsTruncated() && !result.GetNextContinuationToken().empty()) {
    page.next_continuation_token = result.GetNextContinuationToken();
  }

  co_return page;
}

drogon::Task<std::expected<void, BackendError>> S3Service::check_bucket_exists(
    std::string bucket_name) {
  Aws::S3::Model::GetBucketLocationRequest request;
  request.SetBucket(bucket_name);

  auto outcome =
      co_await AsyncOutcomeAwaiter<Aws::S3::Model::GetBucketLocationOutcome>(
          [this, &request](auto complete) {
            s3_client_->GetBucketLocationAsync(
                request,
                [complete](
                    const Aws::S3::S3Client *,
                    const Aws::S3::Model::GetBucketLocationRequest &,
                    const Aws::S3::Model::GetBucketLocationOutcome &outcome,
                    const std::shared_ptr<
                        const Aws::Client::AsyncCallerContext> &) {
                  complete(outcome);
                });
          });
  if (!outcome.IsSuccess()) {
    co_return std::unexpected(
        to_backend_error("GetBucketLocation", outcome.GetError()));
  }

  LOG_DEBUG << "Bucket " << bucket_name << " exists";
  co_return std::expected<void, BackendError>{};
}
