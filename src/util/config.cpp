#include "csv_stream/config.hpp"
#include "csv_stream/log.hpp"

#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace cs {

const std::vector<std::string>& default_dev_origins() {
  static const std::vector<std::string> v = {
      "http://localhost",      "http://localhost:5173", "http://127.0.0.1:5173",
      "http://localhost:8080", "http://localhost:3000", "http://127.0.0.1:3000",
  };
  return v;
}

const char* to_string(AppConfig::Mode m) noexcept {
  switch (m) {
    case AppConfig::Mode::All:       return "all";
    case AppConfig::Mode::Processor: return "processor";
    case AppConfig::Mode::Gateway:   return "gateway";
  }
  return "?";
}

std::optional<StorageConfig> AppConfig::storage_config() const {
  std::string kind = storage;
  if (kind == "auto") kind = production() ? "s3" : "none";
  if (kind == "none") return std::nullopt;

  StorageConfig sc;
  sc.local_base_path = results_dir;
  if (kind == "s3") {
    sc.type = StorageConfig::Type::S3;
    sc.s3_bucket = s3_bucket.empty() ? "my-csv-processor" : s3_bucket;
    sc.s3_region = s3_region;
    sc.s3_access_key = s3_access_key;
    sc.s3_secret_key = s3_secret_key;
    sc.s3_endpoint = s3_endpoint;
    sc.s3_presign_expiry_s = s3_presign_expiry_s;
  }
  return sc;
}

std::vector<std::string> AppConfig::effective_cors_origins() const {
  if (!production() && cors_allow_all) return {"*"};
  if (production()) return cors_origins;
  std::vector<std::string> out = default_dev_origins();
  out.insert(out.end(), cors_extra_origins.begin(), cors_extra_origins.end());
  return out;
}

static std::string trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

static std::vector<std::string> split_list(std::string_view s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t comma = s.find(',', start);
    if (comma == std::string_view::npos) comma = s.size();
    std::string item = trim(s.substr(start, comma - start));
    if (!item.empty()) out.push_back(std::move(item));
    start = comma + 1;
  }
  return out;
}

template <class Int>
static bool parse_int(std::string_view key, std::string_view v, Int* out, Int lo, Int hi, std::string* err) {
  std::string t = trim(v);
  Int x{};
  auto r = std::from_chars(t.data(), t.data() + t.size(), x);
  if (t.empty() || r.ec != std::errc() || r.ptr != t.data() + t.size() || x < lo || x > hi) {
    if (err) *err = std::string(key) + ": expected integer in [" + std::to_string(lo) + ", " +
                    std::to_string(hi) + "], got '" + std::string(v) + "'";
    return false;
  }
  *out = x;
  return true;
}

static bool parse_double(std::string_view key, std::string_view v, double* out, std::string* err) {
  std::string t = trim(v);
  char* end = nullptr;
  double x = t.empty() ? 0.0 : std::strtod(t.c_str(), &end);
  if (t.empty() || end != t.c_str() + t.size() || !(x >= 0.0)) {
    if (err) *err = std::string(key) + ": expected non-negative number, got '" + std::string(v) + "'";
    return false;
  }
  *out = x;
  return true;
}

static bool parse_bool(std::string_view key, std::string_view v, bool* out, std::string* err) {
  std::string t = trim(v);
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (t == "true" || t == "1" || t == "yes") { *out = true; return true; }
  if (t == "false" || t == "0" || t == "no") { *out = false; return true; }
  if (err) *err = std::string(key) + ": expected true/false, got '" + std::string(v) + "'";
  return false;
}

bool set_option(AppConfig& cfg, std::string_view key, std::string_view value, std::string* err) {
  const std::string v(value);

  if (key == "mode") {
    if (v == "all") cfg.mode = AppConfig::Mode::All;
    else if (v == "processor") cfg.mode = AppConfig::Mode::Processor;
    else if (v == "gateway") cfg.mode = AppConfig::Mode::Gateway;
    else { if (err) *err = "mode: expected all|processor|gateway, got '" + v + "'"; return false; }
    return true;
  }
  if (key == "grpc_listen") { cfg.grpc_listen = v; return true; }
  if (key == "grpc_port") {
    int port = 0;
    if (!parse_int(key, v, &port, 0, 65535, err)) return false;
    auto colon = cfg.grpc_listen.rfind(':');
    std::string host = colon == std::string::npos ? cfg.grpc_listen : cfg.grpc_listen.substr(0, colon);
    cfg.grpc_listen = host + ":" + std::to_string(port);
    return true;
  }
  if (key == "grpc_max_workers") return parse_int(key, v, &cfg.grpc_max_workers, 1, 4096, err);
  if (key == "progress_interval_s") return parse_double(key, v, &cfg.progress_interval_s, err);
  if (key == "results_dir") { cfg.results_dir = v; return true; }
  if (key == "max_line_bytes") {
    return parse_int<std::size_t>(key, v, &cfg.max_line_bytes, 1, std::numeric_limits<std::size_t>::max(), err);
  }
  if (key == "gateway_host") { cfg.gateway_host = v; return true; }
  if (key == "gateway_port") return parse_int(key, v, &cfg.gateway_port, 0, 65535, err);
  if (key == "chunk_size") {
    return parse_int<std::size_t>(key, v, &cfg.chunk_size, 1, std::size_t(1) << 30, err);
  }
  if (key == "processor_address") { cfg.processor_address = v; return true; }
  if (key == "upload_dir") { cfg.upload_dir = v; return true; }
  if (key == "gateway_workers") return parse_int(key, v, &cfg.gateway_workers, 1, 1024, err);
  if (key == "job_ttl_s") return parse_int(key, v, &cfg.job_ttl_s, 1, std::numeric_limits<int>::max(), err);
  if (key == "require_api_key") return parse_bool(key, v, &cfg.require_api_key, err);
  if (key == "api_key") { cfg.api_key = v; return true; }
  if (key == "environment") { cfg.environment = trim(v); return true; }
  if (key == "cors_allow_all") return parse_bool(key, v, &cfg.cors_allow_all, err);
  if (key == "cors_origins") { cfg.cors_origins = split_list(v); return true; }
  if (key == "cors_extra_origins") { cfg.cors_extra_origins = split_list(v); return true; }
  if (key == "template_dir") { cfg.template_dir = v; return true; }
  if (key == "storage") {
    if (v != "auto" && v != "none" && v != "local" && v != "s3") {
      if (err) *err = "storage: expected auto|none|local|s3, got '" + v + "'";
      return false;
    }
    cfg.storage = v;
    return true;
  }
  if (key == "s3_bucket") { cfg.s3_bucket = v; return true; }
  if (key == "s3_region") { cfg.s3_region = v; return true; }
  if (key == "s3_access_key") { cfg.s3_access_key = v; return true; }
  if (key == "s3_secret_key") { cfg.s3_secret_key = v; return true; }
  if (key == "s3_endpoint") { cfg.s3_endpoint = v; return true; }
  if (key == "s3_presign_expiry_s") {
    return parse_int<std::uint32_t>(key, v, &cfg.s3_presign_expiry_s, 1, 604800, err);
  }
  if (key == "log_level") {
    if (!parse_log_level(v, nullptr)) {
      if (err) *err = "log_level: expected debug|info|warn|error, got '" + v + "'";
      return false;
    }
    cfg.log_level = trim(v);
    return true;
  }

  if (err) *err = "unknown option: " + std::string(key);
  return false;
}

bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err) {
  simdjson::padded_string json;
  if (simdjson::padded_string::load(path).get(json)) {
    if (err) *err = "cannot read config file: " + path;
    return false;
  }

  try {
    simdjson::ondemand::parser parser;
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      const std::string k(key);
      simdjson::ondemand::value v = field.value();

      std::string text;
      switch (v.type()) {
        case simdjson::ondemand::json_type::string:
          text = std::string(std::string_view(v.get_string()));
          break;
        case simdjson::ondemand::json_type::number:
          text = trim(v.raw_json_token());
          break;
        case simdjson::ondemand::json_type::boolean:
          text = bool(v.get_bool()) ? "true" : "false";
          break;
        case simdjson::ondemand::json_type::array:
          for (auto item : v.get_array()) {
            if (!text.empty()) text.push_back(',');
            text.append(std::string_view(item.get_string()));
          }
          break;
        case simdjson::ondemand::json_type::null:
          continue;
        default:
          if (err) *err = path + ": unsupported value for '" + k + "'";
          return false;
      }

      std::string why;
      if (!set_option(cfg, k, text, &why)) {
        if (err) *err = path + ": " + why;
        return false;
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = path + ": " + e.what();
    return false;
  }
  return true;
}

const std::vector<std::pair<const char*, const char*>>& env_option_names() {
  static const std::vector<std::pair<const char*, const char*>> names = {
      {"GATEWAY_HOST", "gateway_host"},
      {"GATEWAY_PORT", "gateway_port"},
      {"CHUNK_SIZE", "chunk_size"},
      {"GRPC_SERVER_ADDRESS", "processor_address"},
      {"GRPC_PORT", "grpc_port"},
      {"GRPC_MAX_WORKERS", "grpc_max_workers"},
      {"GRPC_UPDATE_INTERVAL", "progress_interval_s"},
      {"API_KEY", "api_key"},
      {"REQUIRE_API_KEY", "require_api_key"},
      {"ENVIRONMENT", "environment"},
      {"AWS_S3_BUCKET", "s3_bucket"},
      {"AWS_REGION", "s3_region"},
      {"AWS_ACCESS_KEY_ID", "s3_access_key"},
      {"AWS_SECRET_ACCESS_KEY", "s3_secret_key"},
      {"S3_ENDPOINT", "s3_endpoint"},
      {"CORS_ALLOWED_ORIGINS", "cors_origins"},
      {"CORS_EXTRA_ORIGINS", "cors_extra_origins"},
      {"CORS_ALLOW_ALL", "cors_allow_all"},
      {"LOG_LEVEL", "log_level"},
      {"RESULTS_DIR", "results_dir"},
  };
  return names;
}

bool apply_env(AppConfig& cfg, const EnvLookup& env, std::string* err) {
  if (!env) return true;
  for (const auto& [var, key] : env_option_names()) {
    const char* v = env(var);
    if (!v) continue;
    std::string why;
    if (!set_option(cfg, key, v, &why)) {
      if (err) *err = std::string(var) + ": " + why;
      return false;
    }
  }
  return true;
}

bool validate(const AppConfig& cfg, std::string* err) {
  if (cfg.grpc_listen.find(':') == std::string::npos) {
    if (err) *err = "grpc_listen must be host:port, got '" + cfg.grpc_listen + "'";
    return false;
  }
  if (cfg.results_dir.empty()) {
    if (err) *err = "results_dir must not be empty";
    return false;
  }
  if (cfg.mode != AppConfig::Mode::Processor && cfg.upload_dir.empty()) {
    if (err) *err = "upload_dir must not be empty";
    return false;
  }
  if (cfg.s3_access_key.empty() != cfg.s3_secret_key.empty()) {
    if (err) *err = "AWS access key and secret key must be set together";
    return false;
  }
  return true;
}

std::string usage_text() {
  return
    "Usage: csv-stream [--mode=all|processor|gateway] [--config=FILE]\n"
    "                  [--grpc-listen=HOST:PORT] [--grpc-max-workers=N]\n"
    "                  [--progress-interval-s=SEC] [--results-dir=DIR]\n"
    "                  [--gateway-host=HOST] [--gateway-port=N] [--chunk-size=BYTES]\n"
    "                  [--processor-address=HOST:PORT] [--upload-dir=DIR]\n"
    "                  [--api-key=KEY] [--require-api-key=true|false]\n"
    "                  [--storage=auto|none|local|s3] [--s3-bucket=NAME] [--s3-endpoint=URL]\n"
    "                  [--log-level=debug|info|warn|error]\n";
}

bool load_config(int argc, char** argv, const EnvLookup& env,
                 AppConfig& cfg, CliResult* cli, std::string* err) {
  CliResult local;
  CliResult& out = cli ? *cli : local;

  std::vector<std::pair<std::string, std::string>> flags;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a == "-h" || a == "--help") { out.help = true; continue; }
    if (a.rfind("--", 0) != 0) {
      if (err) *err = "unexpected argument: " + a;
      return false;
    }
    a = a.substr(2);
    std::string key, value = "true";
    auto eq = a.find('=');
    key = a.substr(0, eq);
    if (eq != std::string::npos) value = a.substr(eq + 1);
    std::replace(key.begin(), key.end(), '-', '_');
    if (key == "config") { out.config_path = value; continue; }
    flags.emplace_back(std::move(key), std::move(value));
  }
  if (out.help) return true;

  if (!out.config_path.empty() && !load_config_file(out.config_path, cfg, err)) return false;
  if (!apply_env(cfg, env, err)) return false;
  for (const auto& [k, v] : flags) {
    std::string why;
    if (!set_option(cfg, k, v, &why)) {
      if (err) *err = "--" + k + ": " + why;
      return false;
    }
  }
  return validate(cfg, err);
}

}
