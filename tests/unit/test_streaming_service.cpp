#include "csv_stream/local_storage.hpp"
#include "csv_stream/streaming_service.hpp"
#include "csv_stream/log.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
namespace v1 = csv_stream::v1;
using Clock = cs::ProcessingSession::Clock;

static int g_fail = 0;
static void check(bool ok, const std::string& msg) {
  if (!ok) { std::cerr << "[FAIL] " << msg << "\n"; ++g_fail; }
}

// Scripted client: hands out chunks, records responses, advances a fake clock per read.
class FakeStream final : public cs::ServerStream {
public:
  std::vector<v1::CsvChunk> chunks;
  std::vector<v1::ProgressUpdate> written;
  Clock::time_point now = Clock::time_point{} + std::chrono::hours(1);
  std::chrono::milliseconds tick{600};
  int fail_writes_after = -1;
  bool cancel_after_first = false;

  bool read(v1::CsvChunk* c) override {
    if (next_ >= chunks.size()) return false;
    *c = chunks[next_++];
    now += tick;
    return true;
  }
  bool write(const v1::ProgressUpdate& u) override {
    if (fail_writes_after >= 0 && static_cast<int>(written.size()) >= fail_writes_after) return false;
    written.push_back(u);
    return true;
  }
  bool is_cancelled() const override { return cancel_after_first && next_ > 1; }

  void add(const std::string& data, std::uint64_t declared = 0) {
    v1::CsvChunk c;
    c.set_data(data);
    if (declared) c.set_file_size_bytes(declared);
    chunks.push_back(std::move(c));
  }

  int summaries() const {
    int n = 0;
    for (auto& u : written) n += u.has_summary() ? 1 : 0;
    return n;
  }

private:
  std::size_t next_ = 0;
};

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static cs::StreamingService make_service(const fs::path& results, FakeStream& fs_,
                                         std::shared_ptr<cs::StorageBackend> storage = nullptr,
                                         double interval = 1.0, std::size_t max_line = 8u << 20) {
  cs::StreamingService::Config cfg;
  cfg.session.results_dir = results;
  cfg.session.progress_interval_s = interval;
  cfg.session.processor.assembler.max_line_bytes = max_line;
  return cs::StreamingService(cfg, std::move(storage), [&fs_] { return fs_.now; });
}

static void test_happy_path(const fs::path& dir) {
  const std::string parts[] = {
    "Department Name,Date,Number of Sales\n",
    "Electronics,2023-08-01,100\n",
    "Clothing,2023-08-01,200\n",
    "Electronics,2023-08-02,150\n",
    "Garden,2023-08-02,1",
  };
  std::uint64_t total = 0;
  for (auto& p : parts) total += p.size();

  FakeStream s;
  bool first = true;
  for (auto& p : parts) { s.add(p, first ? total : 0); first = false; }

  auto svc = make_service(dir, s);
  const cs::Status st = svc.process_csv(s);
  check(st.ok(), cs::concat("session ok: ", st.message));
  check(s.summaries() == 1, cs::concat("exactly one summary, got ", s.summaries()));
  check(s.written.size() == 4, cs::concat("2 throttled + finalizing + summary, got ", s.written.size()));
  if (s.written.size() < 2) return;

  const auto& last = s.written.back();
  const auto& fin = s.written[s.written.size() - 2];
  check(last.has_summary(), "summary is last");
  check(fin.has_status_update() && fin.status_update().processed_percentage() == 100.0 &&
        fin.status_update().message() == "Finalizing aggregation...", "finalizing update precedes summary");

  const auto& up = s.written.front().status_update();
  check(up.message().rfind("Aggregating sales data... (", 0) == 0,
        cs::concat("progress message: ", up.message()));
  check(up.processed_percentage() > 0.0 && up.processed_percentage() < 100.0, "progress in (0,100)");

  const auto& sum = last.summary();
  check(sum.rows_processed() == 4 && sum.malformed_rows() == 0, "summary counts");
  check(sum.total_sales() == 451 && sum.unique_departments() == 3, "summary totals");
  check(sum.processed_percentage() == 100.0, "summary at 100%");
  check(sum.processing_time_seconds() > 2.9 && sum.processing_time_seconds() < 3.1,
        cs::concat("elapsed from injected clock, got ", sum.processing_time_seconds()));
  check(!sum.has_storage_result_file_url(), "no storage url for local results");
  check(sum.result_file_name().size() == 40 && fs::path(sum.result_file_name()).extension() == ".csv",
        cs::concat("uuid4 result name: ", sum.result_file_name()));
  check(slurp(dir / sum.result_file_name()) ==
        "Department Name,Total Number of Sales\r\nClothing,200\r\nElectronics,250\r\nGarden,1\r\n",
        "result file written under results_dir");
}

static void test_declared_size_first_chunk_only(const fs::path& dir) {
  FakeStream s;
  s.add("h1,h2,h3\n");
  s.add("A,x,1\n", 1000);
  auto svc = make_service(dir, s, nullptr, 0.0);
  check(svc.process_csv(s).ok(), "session ok");
  for (auto& u : s.written) {
    if (u.has_status_update() && u.status_update().message() != "Finalizing aggregation...") {
      check(u.status_update().processed_percentage() == 0.0, "size on a later chunk is ignored");
    }
  }
}

static void test_fault_is_internal(const fs::path& dir) {
  FakeStream s;
  s.add("h1,h2,h3\n");
  s.add(std::string(200, 'x'));
  auto svc = make_service(dir, s, nullptr, 1.0, 64);
  const cs::Status st = svc.process_csv(s);
  check(st.code == cs::StatusCode::Internal,
        cs::concat("fault maps to INTERNAL, got ", cs::to_string(st.code)));
  check(st.message.rfind("Processing error: Chunk processing failed:", 0) == 0,
        cs::concat("message: ", st.message));
  check(s.summaries() == 0, "no summary after a fault");
}

static void test_client_gone(const fs::path& dir) {
  FakeStream s;
  s.add("h1,h2,h3\nA,x,1\n");
  s.fail_writes_after = 0;
  auto svc = make_service(dir, s);
  const cs::Status st = svc.process_csv(s);
  check(st.code == cs::StatusCode::Cancelled, "write failure cancels");
  check(s.summaries() == 0, "no summary delivered");

  FakeStream c;
  c.add("h1,h2,h3\n");
  c.add("A,x,1\n");
  c.add("B,x,2\n");
  c.cancel_after_first = true;
  auto svc2 = make_service(dir, c);
  check(svc2.process_csv(c).code == cs::StatusCode::Cancelled, "cancelled call ends CANCELLED");
  check(c.summaries() == 0, "no summary after cancel");
}

static void test_external_storage(const fs::path& dir) {
  auto storage = std::make_shared<cs::LocalStorage>(dir / "bucket");
  FakeStream s;
  s.add("h1,h2,h3\nA,x,1\n");
  auto svc = make_service(dir / "unused", s, storage);
  check(svc.process_csv(s).ok(), "session ok with storage");
  check(s.summaries() == 1 && s.written.back().has_summary(), "summary delivered");
  if (!s.written.empty() && s.written.back().has_summary()) {
    const auto& sum = s.written.back().summary();
    check(sum.has_storage_result_file_url(), "storage url present");
    check(fs::exists(dir / "bucket" / sum.result_file_name()), "object keyed by the result name");
    check(!fs::exists(dir / "unused" / sum.result_file_name()), "nothing written to results_dir");
  }
}

static void test_empty_stream(const fs::path& dir) {
  FakeStream s;
  auto svc = make_service(dir, s);
  check(svc.process_csv(s).ok(), "empty stream still completes");
  check(s.summaries() == 1, "empty stream gets a summary");
  if (!s.written.empty() && s.written.back().has_summary()) {
    check(s.written.back().summary().rows_processed() == 0, "no rows");
  }
}

// Several calls at once on one service and one storage root; each keeps its own totals.
static void test_concurrent_sessions(const fs::path& dir) {
  constexpr int kSessions = 8;
  auto storage = std::make_shared<cs::LocalStorage>(dir / "shared");
  cs::StreamingService::Config cfg;
  cfg.session.results_dir = dir / "unused";
  const cs::StreamingService svc(cfg, storage);

  std::vector<FakeStream> streams(kSessions);
  std::vector<std::string> expected(kSessions);
  for (int i = 0; i < kSessions; ++i) {
    const std::string a = "Dept" + std::to_string(i) + "A";
    const std::string b = "Dept" + std::to_string(i) + "B";
    std::string csv = "Department Name,Date,Number of Sales\n";
    for (int r = 0; r < 20; ++r) {
      csv += (r % 2 ? b : a) + ",2023-08-01," + std::to_string(i + r) + "\n";
    }
    // odd-sized pieces so lines straddle chunk boundaries
    const std::size_t piece = 7 + static_cast<std::size_t>(i);
    for (std::size_t off = 0; off < csv.size(); off += piece) {
      streams[i].add(csv.substr(off, piece), off == 0 ? csv.size() : 0);
    }
    expected[i] = "Department Name,Total Number of Sales\r\n" +
                  a + "," + std::to_string(10 * i + 90) + "\r\n" +
                  b + "," + std::to_string(10 * i + 100) + "\r\n";
  }

  std::vector<cs::Status> results(kSessions);
  std::vector<std::thread> threads;
  for (int i = 0; i < kSessions; ++i) {
    threads.emplace_back([&, i] { results[i] = svc.process_csv(streams[i]); });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> names;
  for (int i = 0; i < kSessions; ++i) {
    const std::string who = "session " + std::to_string(i);
    check(results[i].ok(), cs::concat(who, " ok: ", results[i].message));
    check(streams[i].summaries() == 1, cs::concat(who, " got one summary"));
    if (streams[i].written.empty() || !streams[i].written.back().has_summary()) continue;

    const auto& sum = streams[i].written.back().summary();
    check(sum.rows_processed() == 20 && sum.malformed_rows() == 0, cs::concat(who, " row counts"));
    check(sum.total_sales() == 20 * i + 190 && sum.unique_departments() == 2,
          cs::concat(who, " totals, got ", sum.total_sales()));
    names.insert(sum.result_file_name());
    check(slurp(dir / "shared" / sum.result_file_name()) == expected[i],
          cs::concat(who, " result file content"));
  }
  check(names.size() == static_cast<std::size_t>(kSessions),
        cs::concat("distinct result files, got ", names.size()));
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("cs_svc_test_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  test_happy_path(dir);
  test_declared_size_first_chunk_only(dir);
  test_fault_is_internal(dir);
  test_client_gone(dir);
  test_external_storage(dir);
  test_empty_stream(dir);
  test_concurrent_sessions(dir);

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (g_fail) { std::cerr << "[FAIL] streaming_service: " << g_fail << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] streaming_service\n";
  return 0;
}
