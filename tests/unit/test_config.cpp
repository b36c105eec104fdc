#include "csv_stream/config.hpp"
#include "csv_stream/log.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

static int g_fail = 0;
static void check(bool ok, const std::string& msg) {
  if (!ok) { std::cerr << "[FAIL] " << msg << "\n"; ++g_fail; }
}

using Env = std::map<std::string, std::string>;

static cs::EnvLookup env_of(const Env& env) {
  return [&env](const char* k) -> const char* {
    auto it = env.find(k);
    return it == env.end() ? nullptr : it->second.c_str();
  };
}

static bool run(std::vector<std::string> args, const Env& env, cs::AppConfig& cfg,
                cs::CliResult* cli, std::string* err) {
  args.insert(args.begin(), "csv-stream");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return cs::load_config(static_cast<int>(argv.size()), argv.data(), env_of(env), cfg, cli, err);
}

static void test_defaults() {
  cs::AppConfig cfg;
  std::string err;
  const bool loaded = run({}, {}, cfg, nullptr, &err);
  check(loaded, cs::concat("defaults load: ", err));
  check(cfg.mode == cs::AppConfig::Mode::All, "mode all");
  check(cfg.grpc_listen == "0.0.0.0:50051" && cfg.grpc_max_workers == 20, "grpc defaults");
  check(cfg.gateway_port == 8000 && cfg.chunk_size == (1u << 20), "gateway defaults");
  check(cfg.require_api_key, "api key required by default");
  check(!cfg.storage_config().has_value(), "no backend in development");
  auto cors = cfg.effective_cors_origins();
  check(cors.size() == 1 && cors[0] == "*", "development allows all origins");
}

static void test_file_env_cli_precedence(const fs::path& dir) {
  const fs::path file = dir / "config.json";
  {
    std::ofstream out(file);
    out << R"({
      "gateway_port": 9100,
      "chunk_size": 4096,
      "api_key": "from-file",
      "cors_extra_origins": ["https://a.example", "https://b.example"],
      "require_api_key": false,
      "s3_endpoint": null
    })";
  }
  Env env = {{"GATEWAY_PORT", "9200"}, {"GRPC_PORT", "6000"}, {"CORS_ALLOW_ALL", "false"}};

  cs::AppConfig cfg;
  cs::CliResult cli;
  std::string err;
  const bool layered =
      run({"--config=" + file.string(), "--gateway-port=9300", "--mode=gateway"}, env, cfg, &cli, &err);
  check(layered, cs::concat("layered load: ", err));
  check(cli.config_path == file.string(), "config path recorded");
  check(cfg.gateway_port == 9300, cs::concat("flag beats env beats file, got ", cfg.gateway_port));
  check(cfg.chunk_size == 4096 && cfg.api_key == "from-file", "file values kept");
  check(!cfg.require_api_key, "file bool");
  check(cfg.grpc_listen == "0.0.0.0:6000", cs::concat("GRPC_PORT rewrites the port: ", cfg.grpc_listen));
  check(cfg.mode == cs::AppConfig::Mode::Gateway, "mode flag");

  auto cors = cfg.effective_cors_origins();
  check(cors.size() == cs::default_dev_origins().size() + 2, "dev list plus extras");
  check(!cors.empty() && cors.back() == "https://b.example", "extras appended");
}

static void test_errors(const fs::path& dir) {
  cs::AppConfig cfg;
  std::string err;
  check(!run({"--gateway-port=http"}, {}, cfg, nullptr, &err), "bad int refused");
  check(err.rfind("--gateway_port: gateway_port: expected integer", 0) == 0, cs::concat("int error: ", err));

  cfg = {};
  check(!run({"--no-such-thing=1"}, {}, cfg, nullptr, &err), "unknown flag refused");
  check(err.find("unknown option: no_such_thing") != std::string::npos, cs::concat("unknown error: ", err));

  cfg = {};
  check(!run({"positional"}, {}, cfg, nullptr, &err), "positional refused");

  cfg = {};
  check(!run({}, {{"REQUIRE_API_KEY", "maybe"}}, cfg, nullptr, &err), "bad env bool refused");
  check(err.rfind("REQUIRE_API_KEY: ", 0) == 0, cs::concat("env error names the variable: ", err));

  cfg = {};
  check(!run({"--storage=ftp"}, {}, cfg, nullptr, &err), "bad storage kind");

  cfg = {};
  check(!run({"--s3-access-key=AK"}, {}, cfg, nullptr, &err), "half credentials refused");

  cfg = {};
  check(!run({"--config=" + (dir / "missing.json").string()}, {}, cfg, nullptr, &err), "missing file");
  check(err.rfind("cannot read config file:", 0) == 0, cs::concat("missing file error: ", err));

  const fs::path bad = dir / "bad.json";
  { std::ofstream out(bad); out << R"({"gateway_workers": 0})"; }
  cfg = {};
  check(!run({"--config=" + bad.string()}, {}, cfg, nullptr, &err), "out of range file value");

  cfg = {};
  cs::CliResult cli;
  check(run({"--help", "--gateway-port=x"}, {}, cfg, &cli, &err) && cli.help, "help short-circuits");
}

static void test_storage_selection() {
  cs::AppConfig cfg;
  cfg.environment = "production";
  auto sc = cfg.storage_config();
  check(sc && sc->type == cs::StorageConfig::Type::S3, "production defaults to s3");
  check(sc && sc->s3_bucket == "my-csv-processor", "default bucket");

  cfg.storage = "local";
  cfg.results_dir = "/srv/results";
  sc = cfg.storage_config();
  check(sc && sc->type == cs::StorageConfig::Type::Local && sc->local_base_path == "/srv/results",
        "explicit local backend");

  cfg.storage = "none";
  check(!cfg.storage_config(), "none disables the backend");

  cfg.cors_origins = {"https://app.example"};
  auto cors = cfg.effective_cors_origins();
  check(cors.size() == 1 && cors[0] == "https://app.example", "production uses the allow-list only");
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("cs_config_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  test_defaults();
  test_file_env_cli_precedence(dir);
  test_errors(dir);
  test_storage_selection();

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (g_fail) { std::cerr << "[FAIL] config: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] config\n";
  return 0;
}
