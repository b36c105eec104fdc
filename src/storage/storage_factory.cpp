#include "csv_stream/storage_backend.hpp"
#include "csv_stream/local_storage.hpp"
#include "csv_stream/s3_storage.hpp"

namespace cs {

std::unique_ptr<StorageBackend> make_storage(const StorageConfig& cfg, std::string* err) {
  switch (cfg.type) {
    case StorageConfig::Type::Local:
      return std::make_unique<LocalStorage>(cfg.local_base_path);
    case StorageConfig::Type::S3: {
      if (cfg.s3_bucket.empty()) {
        if (err) *err = "S3 storage requires a bucket name";
        return nullptr;
      }
      if (cfg.s3_access_key.empty() != cfg.s3_secret_key.empty()) {
        if (err) *err = "S3 storage requires both access key and secret key";
        return nullptr;
      }
      S3Storage::Config sc;
      sc.bucket = cfg.s3_bucket;
      sc.endpoint = cfg.s3_endpoint;
      sc.creds.access_key = cfg.s3_access_key;
      sc.creds.secret_key = cfg.s3_secret_key;
      sc.creds.region = cfg.s3_region;
      sc.presign_expiry_s = cfg.s3_presign_expiry_s;
      return std::make_unique<S3Storage>(std::move(sc));
    }
  }
  if (err) *err = "unknown storage type";
  return nullptr;
}

}
