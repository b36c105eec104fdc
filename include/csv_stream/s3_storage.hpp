#pragma once
#include "csv_stream/sigv4.hpp"
#include "csv_stream/storage_backend.hpp"
#include <ctime>
#include <functional>

namespace cs {

// S3 or an S3-compatible service (DigitalOcean Spaces, MinIO) over the REST API.
// Without an endpoint, AWS virtual-hosted addressing is used; with one, path-style.
class S3Storage final : public StorageBackend {
public:
  struct Config {
    std::string bucket;
    std::string endpoint; // "https://nyc3.digitaloceanspaces.com", "http://127.0.0.1:9000"
    AwsCredentials creds;
    std::uint32_t presign_expiry_s = 3600;
    int timeout_s = 30;
  };
  using NowFn = std::function<std::time_t()>;

  explicit S3Storage(Config cfg, NowFn now = nullptr);
  ~S3Storage() override;
  S3Storage(const S3Storage&) = delete;
  S3Storage& operator=(const S3Storage&) = delete;

  std::optional<std::string> save(const std::string& path,
                                  std::string_view content,
                                  std::string* err) override;
  bool exists(const std::string& path) override;

  // Spaces: public object URL. Otherwise a presigned GET, or s3://bucket/key without credentials.
  std::string url_for(const std::string& path) override;
  const char* kind() const noexcept override { return "s3"; }

  // "scheme", "host[:port]" and the canonical URI an object key maps to.
  std::string scheme() const;
  std::string host() const;
  std::string object_uri(const std::string& key) const;

private:
  struct Impl;
  Impl* p_;
};

}
