#include "csv_stream/job_runner.hpp"
#include "csv_stream/job_store.hpp"
#include "csv_stream/local_storage.hpp"
#include "csv_stream/processor_client.hpp"
#include "csv_stream/streaming_service.hpp"
#include "csv_stream/log.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static int g_fail = 0;
static void check(bool ok, const std::string& msg) {
  if (!ok) { std::cerr << "[FAIL] " << msg << "\n"; ++g_fail; }
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// Copies a fixture into the spool area the way the gateway would leave it.
static std::string spool_copy(const fs::path& dir, const std::string& fixture, const std::string& id) {
  const fs::path dst = dir / "uploads" / (id + ".upload");
  fs::create_directories(dst.parent_path());
  fs::copy_file(fixture, dst, fs::copy_options::overwrite_existing);
  return dst.string();
}

static std::shared_ptr<const cs::StreamingService> make_service(const fs::path& results,
                                                                 std::shared_ptr<cs::StorageBackend> storage) {
  cs::StreamingService::Config sc;
  sc.session.results_dir = results;
  sc.session.progress_interval_s = 0.0;
  return std::make_shared<const cs::StreamingService>(sc, std::move(storage));
}

static cs::JobRecord run_job(cs::JobRunner& runner, cs::JobStore& store, const fs::path& dir,
                             const std::string& id, const std::string& fixture) {
  cs::JobRecord r;
  r.job_id = id;
  r.filename = fs::path(fixture).filename().string();
  r.file_size_bytes = fs::file_size(fixture);
  store.put(r);
  runner.run_one({id, spool_copy(dir, fixture, id), r.file_size_bytes});
  return store.get(id).value_or(cs::JobRecord{});
}

static void test_small_file(const fs::path& dir) {
  auto store = std::make_shared<cs::InMemoryJobStore>();
  // small chunks so the upload crosses several messages
  auto client = std::make_shared<cs::InProcessClient>(make_service(dir / "results", nullptr), 16);
  cs::JobRunner::Config rc;
  rc.workers = 1;
  cs::JobRunner runner(rc, store, client);

  auto r = run_job(runner, *store, dir, "small", "tests/data/sales_small.csv");
  check(r.status == cs::JobStatus::Complete,
        cs::concat("small: complete, got ", cs::to_string(r.status), " ", r.error));
  check(r.rows_processed == 5 && r.malformed_rows == 0, "small: row counts");
  check(r.total_sales == 550 && r.unique_departments == 3, cs::concat("small: totals ", r.total_sales));
  check(r.processed_percentage == 100.0, "small: 100%");
  check(r.result_file_url == "/download/" + r.result_file_name, "small: download url");
  check(!r.storage_result_file_url, "small: no storage url");
  check(slurp(dir / "results" / r.result_file_name) ==
        "Department Name,Total Number of Sales\r\nClothing,225\r\nElectronics,250\r\nGarden,75\r\n",
        "small: result content");
  check(!fs::exists(dir / "uploads" / "small.upload"), "small: spool removed");
  runner.stop();
}

static void test_mixed_file_with_storage(const fs::path& dir) {
  auto store = std::make_shared<cs::InMemoryJobStore>();
  auto storage = std::make_shared<cs::LocalStorage>(dir / "store");
  auto client = std::make_shared<cs::InProcessClient>(make_service(dir / "results", storage), 7);
  cs::JobRunner::Config rc;
  rc.workers = 1;
  cs::JobRunner runner(rc, store, client);

  auto r = run_job(runner, *store, dir, "mixed", "tests/data/sales_mixed.csv");
  check(r.status == cs::JobStatus::Complete, cs::concat("mixed: complete ", r.error));
  check(r.rows_processed == 3 && r.malformed_rows == 5,
        cs::concat("mixed: counts ", r.rows_processed, "/", r.malformed_rows));
  check(r.total_sales == 140, "mixed: total");
  check(r.storage_result_file_url && *r.storage_result_file_url == storage->url_for(r.result_file_name),
        "mixed: storage url recorded");
  check(storage->exists(r.result_file_name), "mixed: object stored");
  check(slurp(dir / "store" / r.result_file_name) ==
        "Department Name,Total Number of Sales\r\nElectronics,100\r\nGarden,0\r\n\"Home, Kitchen\",40\r\n",
        "mixed: result content");
  runner.stop();
}

static void test_missing_spool(const fs::path& dir) {
  auto store = std::make_shared<cs::InMemoryJobStore>();
  auto client = std::make_shared<cs::InProcessClient>(make_service(dir / "results", nullptr), 1024);
  cs::JobRunner::Config rc;
  rc.workers = 1;
  cs::JobRunner runner(rc, store, client);

  cs::JobRecord r;
  r.job_id = "gone";
  store->put(r);
  runner.run_one({"gone", (dir / "uploads" / "nope.upload").string(), 0});
  auto got = store->get("gone");
  check(got && got->status == cs::JobStatus::Failed, "missing spool fails the job");
  check(got && got->error.rfind("open failed:", 0) == 0,
        cs::concat("missing spool error: ", (got ? got->error : "")));
  runner.stop();
}

static void test_chunk_reader_helper() {
  std::string joined;
  int calls = 0;
  std::string err;
  check(cs::for_each_file_chunk("tests/data/sales_small.csv", 10,
                                [&](std::string_view c) { joined.append(c); ++calls; return true; }, &err),
        "chunked read ok");
  check(joined == slurp("tests/data/sales_small.csv"), "chunks reassemble the file");
  check(calls == 16, cs::concat("159 bytes in 10-byte chunks, got ", calls));

  calls = 0;
  cs::for_each_file_chunk("tests/data/sales_small.csv", 10, [&](std::string_view) { return ++calls < 2; }, &err);
  check(calls == 2, "early stop");
  check(!cs::for_each_file_chunk("tests/data/does_not_exist.csv", 10,
                                 [](std::string_view) { return true; }, &err), "missing file");
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("cs_e2e_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  test_small_file(dir);
  test_mixed_file_with_storage(dir);
  test_missing_spool(dir);
  test_chunk_reader_helper();

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (g_fail) { std::cerr << "[FAIL] end_to_end_csv: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] end_to_end_csv\n";
  return 0;
}
