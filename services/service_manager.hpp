#ifndef SERVICE_MANAGER_HPP
#define SERVICE_MANAGER_HPP

#include <aws/core/Aws.h>

#include <memory>

#include "./inspection/bucket_inspector.hpp"
#include "./storage/s3_service.hpp"

/**
 * @brief Owns the AWS SDK lifetime and the services built on top of it.
 * Created once in main() after the config file is loaded.
 */
class ServiceManager {
 public:
  ServiceManager() = default;
  ~ServiceManager() { shutdown(); }

  // non-copyable
  ServiceManager(const ServiceManager&) = delete;
  ServiceManager& operator=(const ServiceManager&) = delete;

  BucketInspector& get_inspector() { return *inspector_; }

  void initialize() {
    // AWS SDK
    Aws::InitAPI(options_);
    aws_initialized_ = true;

    s3_service_ = std::make_unique<S3Service>();
    inspector_ = std::make_unique<BucketInspector>(*s3_service_);
  }

  void shutdown() {
    // The client must be gone before the SDK shuts down
    inspector_.reset();
    s3_service_.reset();

    if (aws_initialized_) {
      Aws::ShutdownAPI(options_);
      aws_initialized_ = false;
    }
  }

 private:
  Aws::SDKOptions options_;
  bool aws_initialized_ = false;
  std::unique_ptr<S3Service> s3_service_;
  std::unique_ptr<BucketInspector> inspector_;
};

#endif  // SERVICE_MANAGER_HPP
