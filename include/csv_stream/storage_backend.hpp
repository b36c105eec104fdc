#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Where finished result files go. One instance is shared by all sessions, so
// implementations must tolerate concurrent calls on different paths.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  // Stores `content` under the logical `path`; returns the locator, or nullopt with `err` set.
  virtual std::optional<std::string> save(const std::string& path,
                                          std::string_view content,
                                          std::string* err) = 0;

  virtual bool exists(const std::string& path) = 0;

  // Reference a client can use to fetch `path` (filesystem path, signed URL, ...).
  virtual std::string url_for(const std::string& path) = 0;

  virtual const char* kind() const noexcept = 0;
};

struct StorageConfig {
  enum class Type { Local, S3 };

  Type type = Type::Local;
  std::string local_base_path = "results";

  std::string s3_bucket;
  std::string s3_region = "us-east-1";
  std::string s3_access_key;
  std::string s3_secret_key;
  std::string s3_endpoint;            // S3-compatible services (Spaces, MinIO)
  std::uint32_t s3_presign_expiry_s = 3600;
};

// Builds the backend named by `cfg.type`; nullptr with `err` set on bad configuration.
std::unique_ptr<StorageBackend> make_storage(const StorageConfig& cfg, std::string* err);

}
