#include "csv_stream/job_store.hpp"
#include "csv_stream/log.hpp"
#include <chrono>

namespace cs {

const char* to_string(JobStatus s) noexcept {
  switch (s) {
    case JobStatus::Uploading:  return "uploading";
    case JobStatus::Processing: return "processing";
    case JobStatus::Complete:   return "complete";
    case JobStatus::Failed:     return "failed";
  }
  return "?";
}

double unix_now() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

InMemoryJobStore::InMemoryJobStore() : InMemoryJobStore(Config{}) {}

InMemoryJobStore::InMemoryJobStore(Config cfg, NowFn now)
  : cfg_(cfg), now_(std::move(now)) {
  if (!now_) now_ = unix_now;
}

void InMemoryJobStore::put(JobRecord r) {
  std::lock_guard<std::mutex> lk(mu_);
  evict_locked();
  if (r.created_at == 0.0) r.created_at = now_();
  r.updated_at = now_();
  if (!r.result_file_name.empty()) by_result_[r.result_file_name] = r.job_id;
  std::string id = r.job_id;
  jobs_[std::move(id)] = std::move(r);
}

std::optional<JobRecord> InMemoryJobStore::get(const std::string& job_id) {
  std::lock_guard<std::mutex> lk(mu_);
  evict_locked();
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryJobStore::update(const std::string& job_id, const Mutator& fn) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return false;
  const std::string before = it->second.result_file_name;
  fn(it->second);
  it->second.updated_at = now_();
  if (it->second.result_file_name != before) {
    if (!before.empty()) by_result_.erase(before);
    if (!it->second.result_file_name.empty()) by_result_[it->second.result_file_name] = job_id;
  }
  return true;
}

std::optional<JobRecord> InMemoryJobStore::find_by_result(const std::string& result_file_name) {
  std::lock_guard<std::mutex> lk(mu_);
  evict_locked();
  auto it = by_result_.find(result_file_name);
  if (it == by_result_.end()) return std::nullopt;
  auto jt = jobs_.find(it->second);
  if (jt == jobs_.end()) return std::nullopt;
  return jt->second;
}

std::size_t InMemoryJobStore::size() {
  std::lock_guard<std::mutex> lk(mu_);
  evict_locked();
  return jobs_.size();
}

std::size_t InMemoryJobStore::evict_expired() {
  std::lock_guard<std::mutex> lk(mu_);
  return evict_locked();
}

std::size_t InMemoryJobStore::evict_locked() {
  const double cutoff = now_() - cfg_.ttl_s;
  std::size_t n = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (it->second.finished() && it->second.updated_at < cutoff) {
      if (!it->second.result_file_name.empty()) by_result_.erase(it->second.result_file_name);
      it = jobs_.erase(it);
      ++n;
    } else {
      ++it;
    }
  }
  if (n) log_debug("jobs", concat("evicted ", n, " expired job(s)"));
  return n;
}

}
