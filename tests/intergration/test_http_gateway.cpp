#include "csv_stream/http_gateway.hpp"
#include "csv_stream/job_runner.hpp"
#include "csv_stream/job_store.hpp"
#include "csv_stream/processor_client.hpp"
#include "csv_stream/streaming_service.hpp"
#include "csv_stream/log.hpp"
#include <httplib.h>
#include <simdjson.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static int g_fail = 0;
static void check(bool ok, const std::string& msg) {
  if (!ok) { std::cerr << "[FAIL] " << msg << "\n"; ++g_fail; }
}

static const char* kKey = "test-key";
static const char* kOrigin = "http://localhost:5173";

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static std::string json_string(const std::string& body, const char* field) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string ps(body);
  auto doc = parser.iterate(ps);
  std::string_view v;
  if (doc[field].get_string().get(v)) return {};
  return std::string(v);
}

static int64_t json_int(const std::string& body, const char* field) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string ps(body);
  auto doc = parser.iterate(ps);
  int64_t v = -1;
  if (doc[field].get_int64().get(v)) return -1;
  return v;
}

static httplib::Headers auth() { return {{"X-API-Key", kKey}}; }

static std::string upload(httplib::Client& cli, const std::string& name, const std::string& content,
                          int* status) {
  httplib::MultipartFormDataItems items = {
      {"file", content, name, "text/csv"},
      {"file_size_bytes", std::to_string(content.size()), "", ""},
  };
  auto res = cli.Post("/upload", auth(), items);
  *status = res ? res->status : -1;
  return res ? res->body : std::string();
}

static std::string wait_finished(httplib::Client& cli, const std::string& id) {
  for (int i = 0; i < 100; ++i) {
    auto res = cli.Get(("/status/" + id).c_str(), auth());
    if (res && res->status == 200) {
      const std::string st = json_string(res->body, "status");
      if (st == "complete" || st == "failed") return res->body;
    }
    std::this_thread::sleep_for(50ms);
  }
  return {};
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("cs_gateway_test_" + std::to_string(::getpid()));
  fs::create_directories(dir / "results");

  cs::StreamingService::Config sc;
  sc.session.results_dir = dir / "results";
  auto service = std::make_shared<const cs::StreamingService>(sc, nullptr);

  auto jobs = std::make_shared<cs::InMemoryJobStore>();
  auto client = std::make_shared<cs::InProcessClient>(service, 64);
  cs::JobRunner::Config rc;
  rc.workers = 2;
  auto runner = std::make_shared<cs::JobRunner>(rc, jobs, client);

  cs::HttpGateway::Config hc;
  hc.port = 0;
  hc.upload_dir = (dir / "uploads").string();
  hc.results_dir = (dir / "results").string();
  hc.api_key = kKey;
  hc.cors_origins = {kOrigin};
  cs::HttpGateway gw(hc, jobs, runner, nullptr);
  if (!gw.start()) {
    std::cerr << "[FAIL] gateway did not bind\n";
    return 1;
  }
  std::thread srv([&] { gw.run(); });

  httplib::Client cli("127.0.0.1", gw.port());
  cli.set_read_timeout(5, 0);
  bool up = false;
  for (int i = 0; i < 50 && !up; ++i) {
    if (auto res = cli.Get("/", auth())) up = res->status == 200;
    else std::this_thread::sleep_for(100ms);
  }
  check(up, "gateway answers GET /");

  // auth
  {
    auto res = cli.Get("/");
    check(res && res->status == 401 && json_string(res->body, "detail") == "API key required", "missing key");
    res = cli.Get("/", {{"X-API-Key", "nope"}});
    check(res && res->status == 401 && json_string(res->body, "detail") == "Invalid API key", "wrong key");
    res = cli.Get("/", auth());
    check(res && json_string(res->body, "message") == "gRPC CSV Processor Gateway is running.", "root message");
  }

  // CORS
  {
    auto res = cli.Options("/upload", {{"Origin", kOrigin}, {"Access-Control-Request-Method", "POST"}});
    check(res && res->status == 204, "preflight without key is allowed");
    check(res && res->get_header_value("Access-Control-Allow-Origin") == kOrigin, "preflight echoes origin");
    check(res && res->get_header_value("Access-Control-Allow-Methods").find("POST") != std::string::npos,
          "preflight lists methods");
    res = cli.Get("/", {{"X-API-Key", kKey}, {"Origin", "http://evil.example"}});
    check(res && !res->has_header("Access-Control-Allow-Origin"), "unknown origin gets no CORS headers");
  }

  // upload rejections
  {
    int status = 0;
    std::string body = upload(cli, "notes.txt", "hello", &status);
    check(status == 400 && json_string(body, "detail") == "Only CSV files are allowed.",
          cs::concat("non-csv upload: ", body));

    httplib::MultipartFormDataItems no_file = {{"other", "x", "", ""}};
    auto res = cli.Post("/upload", auth(), no_file);
    check(res && res->status == 400 && json_string(res->body, "detail") == "Missing file in upload.",
          "missing file part");
  }

  // full job
  const std::string csv = slurp("tests/data/sales_small.csv");
  int status = 0;
  const std::string accepted = upload(cli, "sales_small.csv", csv, &status);
  check(status == 202, cs::concat("upload accepted, got ", status, " ", accepted));
  const std::string job_id = json_string(accepted, "job_id");
  check(job_id.size() == 36, cs::concat("job id is a uuid: ", job_id));

  const std::string done = wait_finished(cli, job_id);
  check(json_string(done, "status") == "complete", cs::concat("job completes: ", done));
  check(json_string(done, "filename") == "sales_small.csv", "filename kept");
  check(json_int(done, "file_size_bytes") == static_cast<int64_t>(csv.size()), "declared size recorded");
  check(json_int(done, "total_sales") == 550, "total sales");
  check(json_int(done, "rows_processed") == 5, "rows processed");
  const std::string result = json_string(done, "result_file_name");
  check(json_string(done, "result_file_url") == "/download/" + result, "download url");

  // download
  {
    auto res = cli.Get(("/download/" + result).c_str(), auth());
    check(res && res->status == 200, "download ok");
    check(res && res->body == "Department Name,Total Number of Sales\r\nClothing,225\r\nElectronics,250\r\nGarden,75\r\n",
          "download body");
    check(res && res->get_header_value("Content-Disposition").rfind("attachment; filename=\"Processed_sales_small_", 0) == 0,
          cs::concat("attachment name: ", (res ? res->get_header_value("Content-Disposition") : "")));
    check(res && res->get_header_value("Cache-Control") == "no-cache", "no-cache");

    res = cli.Get("/download/results.txt", auth());
    check(res && res->status == 400 &&
          json_string(res->body, "detail") == "Only CSV files are available for download.", "non-csv download");
    res = cli.Get("/download/nothing-here.csv", auth());
    check(res && res->status == 404 && json_string(res->body, "detail") == "Result file not found.", "missing result");
  }

  // status / report
  {
    auto res = cli.Get("/status/unknown-id", auth());
    check(res && res->status == 404 && json_string(res->body, "detail") == "Job ID unknown-id not found.",
          "unknown job");
    res = cli.Get(("/jobs/" + job_id + "/report").c_str(), auth());
    check(res && res->status == 200, "report page");
    check(res && res->get_header_value("Content-Type").rfind("text/html", 0) == 0, "report is html");
    check(res && res->body.find("sales_small.csv") != std::string::npos, "report names the file");
    check(res && res->body.find("550") != std::string::npos, "report shows the total");
  }

  // a repeated "file" part is not appended to the upload
  {
    httplib::MultipartFormDataItems twice = {
        {"file", csv, "first.csv", "text/csv"},
        {"file", "Zzz,2024-01-01,999\n", "second.csv", "text/csv"},
    };
    auto res = cli.Post("/upload", auth(), twice);
    check(res && res->status == 202, "upload with two file parts accepted");
    const std::string id = res ? json_string(res->body, "job_id") : std::string();
    const std::string fin = wait_finished(cli, id);
    check(json_string(fin, "status") == "complete", cs::concat("first part processed: ", fin));
    check(json_string(fin, "filename") == "first.csv", "filename from the first part");
    check(json_int(fin, "total_sales") == 550 && json_int(fin, "unique_departments") == 3,
          cs::concat("second part ignored: ", fin));
    check(json_int(fin, "rows_processed") == 5, "rows from the first part only");
    auto dl = cli.Get(("/download/" + json_string(fin, "result_file_name")).c_str(), auth());
    check(dl && dl->body.find("Zzz") == std::string::npos, "no rows from the second part");
  }

  gw.stop();
  srv.join();
  runner->stop();

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (g_fail) { std::cerr << "[FAIL] http_gateway: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] http_gateway\n";
  return 0;
}
