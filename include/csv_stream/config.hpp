#pragma once
#include "csv_stream/storage_backend.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

struct AppConfig {
  enum class Mode { All, Processor, Gateway };

  Mode mode = Mode::All;

  // processor
  std::string grpc_listen = "0.0.0.0:50051";
  int grpc_max_workers = 20;
  double progress_interval_s = 1.0;
  std::string results_dir = "results";
  std::size_t max_line_bytes = 8u << 20;

  // gateway
  std::string gateway_host = "127.0.0.1";
  int gateway_port = 8000;
  std::size_t chunk_size = 1u << 20;
  std::string processor_address; // empty: in-process
  std::string upload_dir = "uploads";
  int gateway_workers = 5;
  int job_ttl_s = 3600;
  bool require_api_key = true;
  std::string api_key;
  std::string environment = "development";
  bool cors_allow_all = true;
  std::vector<std::string> cors_origins;       // production allow-list
  std::vector<std::string> cors_extra_origins; // appended to the development list
  std::string template_dir = "templates";

  // "auto" (s3 in production, none otherwise) | "none" | "local" | "s3"
  std::string storage = "auto";
  std::string s3_bucket;
  std::string s3_region = "us-east-1";
  std::string s3_access_key;
  std::string s3_secret_key;
  std::string s3_endpoint;
  std::uint32_t s3_presign_expiry_s = 3600;

  std::string log_level = "info";

  bool production() const { return environment == "production"; }

  // nullopt: no backend, results are plain files under results_dir.
  std::optional<StorageConfig> storage_config() const;

  // "*" alone when every origin is allowed.
  std::vector<std::string> effective_cors_origins() const;
};

const std::vector<std::string>& default_dev_origins();
const char* to_string(AppConfig::Mode m) noexcept;

// Sets one option by its snake_case key. False (with `err`) on unknown key or bad value.
bool set_option(AppConfig& cfg, std::string_view key, std::string_view value, std::string* err);

// Flat JSON object of option keys; arrays are accepted for list options.
bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err);

using EnvLookup = std::function<const char*(const char*)>;

// GATEWAY_HOST, GRPC_PORT, AWS_S3_BUCKET, ... (see env_option_names()).
bool apply_env(AppConfig& cfg, const EnvLookup& env, std::string* err);
const std::vector<std::pair<const char*, const char*>>& env_option_names();

// Cross-field checks once all layers are applied.
bool validate(const AppConfig& cfg, std::string* err);

struct CliResult {
  bool help = false;
  std::string config_path;
};

// defaults <- --config file <- environment <- --key=value flags, then validate().
bool load_config(int argc, char** argv, const EnvLookup& env,
                 AppConfig& cfg, CliResult* cli, std::string* err);

std::string usage_text();

}
