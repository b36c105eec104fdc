#include "csv_stream/job_runner.hpp"
#include "csv_stream/log.hpp"
#include <filesystem>
#include <system_error>

namespace cs {

namespace v1 = csv_stream::v1;

JobRunner::JobRunner(Config cfg, std::shared_ptr<JobStore> jobs, std::shared_ptr<ProcessorClient> client)
  : cfg_(cfg), jobs_(std::move(jobs)), client_(std::move(client)), queue_(cfg.queue_capacity) {
  const int n = cfg_.workers > 0 ? cfg_.workers : 1;
  workers_.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) workers_.emplace_back([this, i] { worker_loop(i); });
  log_info("runner", concat(n, " worker(s) using ", client_->kind(), " processor"));
}

JobRunner::~JobRunner() { stop(); }

bool JobRunner::submit(JobTicket t) {
  const std::string id = t.job_id;
  if (!queue_.try_push(std::move(t))) {
    log_warn("runner", concat("queue full, rejecting job ", id));
    return false;
  }
  return true;
}

void JobRunner::stop() {
  if (stopped_) return;
  stopped_ = true;
  queue_.close();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void JobRunner::worker_loop(int idx) {
  JobTicket t;
  while (queue_.pop(t)) {
    try {
      run_one(t);
    } catch (const std::exception& e) {
      log_error("runner", concat("worker ", idx, ": job ", t.job_id, " threw: ", e.what()));
      jobs_->update(t.job_id, [&](JobRecord& r) {
        r.status = JobStatus::Failed;
        r.error = e.what();
      });
    }
  }
}

void JobRunner::run_one(const JobTicket& t) {
  log_info("runner", concat("job ", t.job_id, ": starting"));
  ProcessorEvents ev;
  ev.on_status = [&](const v1::ProcessingStatus& s) {
    jobs_->update(t.job_id, [&](JobRecord& r) {
      r.status = JobStatus::Processing;
      r.rows_processed = s.rows_processed();
      r.malformed_rows = s.malformed_rows();
      r.processed_percentage = s.processed_percentage();
      r.message = s.message();
    });
    if (log_enabled(LogLevel::Debug)) {
      log_debug("runner", concat("job ", t.job_id, ": progress ", s.rows_processed(), " rows"));
    }
  };
  ev.on_summary = [&](const v1::ProcessSummary& s) {
    jobs_->update(t.job_id, [&](JobRecord& r) {
      r.status = JobStatus::Complete;
      r.rows_processed = s.rows_processed();
      r.malformed_rows = s.malformed_rows();
      r.processed_percentage = s.processed_percentage();
      r.total_sales = s.total_sales();
      r.unique_departments = s.unique_departments();
      r.processing_time_seconds = s.processing_time_seconds();
      r.result_file_name = s.result_file_name();
      r.result_file_url = "/download/" + s.result_file_name();
      if (s.has_storage_result_file_url() && !s.storage_result_file_url().empty()) {
        r.storage_result_file_url = s.storage_result_file_url();
      } else {
        r.storage_result_file_url.reset();
      }
      r.message.clear();
    });
    log_info("runner", concat("job ", t.job_id, ": COMPLETE. File: ", s.result_file_name()));
  };

  const Status st = client_->process_file(t.spool_path, t.declared_size, ev);
  if (!st.ok()) {
    log_error("runner", concat("job ", t.job_id, " failed: ", st.message));
    jobs_->update(t.job_id, [&](JobRecord& r) {
      r.status = JobStatus::Failed;
      r.error = st.message;
    });
  }

  if (cfg_.remove_spool) {
    std::error_code ec;
    std::filesystem::remove(t.spool_path, ec);
    if (ec) log_warn("runner", concat("cannot remove spool ", t.spool_path, ": ", ec.message()));
  }
}

}
