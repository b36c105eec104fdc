#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cs {

enum class JobStatus { Uploading, Processing, Complete, Failed };
const char* to_string(JobStatus s) noexcept;

// Everything the gateway knows about one upload. Times are Unix seconds.
struct JobRecord {
  std::string job_id;
  std::string filename;
  std::uint64_t file_size_bytes = 0;
  JobStatus status = JobStatus::Uploading;

  std::uint64_t rows_processed = 0;
  std::uint64_t malformed_rows = 0;
  double processed_percentage = 0.0;
  std::string message;

  std::int64_t total_sales = 0;
  std::uint64_t unique_departments = 0;
  double processing_time_seconds = 0.0;
  std::string result_file_name;
  std::string result_file_url;
  std::optional<std::string> storage_result_file_url;

  std::string error;
  double created_at = 0.0;
  double updated_at = 0.0;

  bool finished() const noexcept {
    return status == JobStatus::Complete || status == JobStatus::Failed;
  }
};

// JSON object as served by GET /status/{id}; optional fields appear only when set.
std::string job_to_json(const JobRecord& r);
std::string json_message(std::string_view key, std::string_view value);

class JobStore {
public:
  using Mutator = std::function<void(JobRecord&)>;

  virtual ~JobStore() = default;

  virtual void put(JobRecord r) = 0;
  virtual std::optional<JobRecord> get(const std::string& job_id) = 0;

  // Applies `fn` under the store's lock; false when the job is unknown.
  virtual bool update(const std::string& job_id, const Mutator& fn) = 0;

  virtual std::optional<JobRecord> find_by_result(const std::string& result_file_name) = 0;
  virtual std::size_t size() = 0;
};

// Mutex-guarded map. Finished records idle for longer than `ttl_s` (by updated_at)
// are dropped lazily; queued and running jobs are never evicted.
class InMemoryJobStore final : public JobStore {
public:
  using NowFn = std::function<double()>;
  struct Config {
    double ttl_s = 3600.0;
  };

  InMemoryJobStore();
  explicit InMemoryJobStore(Config cfg, NowFn now = {});

  void put(JobRecord r) override;
  std::optional<JobRecord> get(const std::string& job_id) override;
  bool update(const std::string& job_id, const Mutator& fn) override;
  std::optional<JobRecord> find_by_result(const std::string& result_file_name) override;
  std::size_t size() override;

  std::size_t evict_expired();
  double now() const { return now_(); }

private:
  std::size_t evict_locked();

  Config cfg_;
  NowFn now_;
  std::mutex mu_;
  std::unordered_map<std::string, JobRecord> jobs_;
  std::unordered_map<std::string, std::string> by_result_;
};

double unix_now();

}
