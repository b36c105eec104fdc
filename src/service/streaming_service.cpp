#include "csv_stream/streaming_service.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/storage_backend.hpp"
#include <cstdio>

namespace cs {

namespace v1 = csv_stream::v1;

const char* to_string(StatusCode c) noexcept {
  switch (c) {
    case StatusCode::Ok:              return "OK";
    case StatusCode::Cancelled:       return "CANCELLED";
    case StatusCode::InvalidArgument: return "INVALID_ARGUMENT";
    case StatusCode::Internal:        return "INTERNAL";
  }
  return "UNKNOWN";
}

namespace {

v1::ProgressUpdate status_update(const ProcessingSession& s, const char* what) {
  const double pct = s.percent_complete();
  const ProcessingStats st = s.processor().stats();
  char msg[160];
  std::snprintf(msg, sizeof(msg), "%s (%.2f%%)", what, pct);

  v1::ProgressUpdate u;
  auto* su = u.mutable_status_update();
  su->set_rows_processed(st.rows_processed);
  su->set_malformed_rows(st.malformed_rows);
  su->set_processed_percentage(pct);
  su->set_message(msg);
  return u;
}

v1::ProgressUpdate finalizing_update(const ProcessingSession& s) {
  const ProcessingStats st = s.processor().stats();
  v1::ProgressUpdate u;
  auto* su = u.mutable_status_update();
  su->set_rows_processed(st.rows_processed);
  su->set_malformed_rows(st.malformed_rows);
  su->set_processed_percentage(100.0);
  su->set_message("Finalizing aggregation...");
  return u;
}

Status cancelled(ProcessingSession& s, const char* why) {
  log_warn("session", concat(s.output_id(), ": ", why, ", dropping session state"));
  s.processor().release();
  return Status::Cancelled(why);
}

Status failed(ProcessingSession& s) {
  const std::string& cause = s.processor().error();
  log_error("session", concat(s.output_id(), ": error during stream processing: ", cause));
  s.processor().release();
  return Status::Internal("Processing error: " + cause);
}

}

StreamingService::StreamingService(Config cfg, std::shared_ptr<StorageBackend> storage,
                                   ProcessingSession::NowFn now)
  : cfg_(std::move(cfg)), storage_(std::move(storage)), now_(std::move(now)) {}

Status StreamingService::process_csv(ServerStream& stream) const {
  ProcessingSession s(cfg_.session, storage_.get(), now_);
  log_info("session", concat("new CSV stream processing session, output ", s.output_id()));

  v1::CsvChunk chunk;
  std::uint64_t chunk_no = 0;
  while (stream.read(&chunk)) {
    if (stream.is_cancelled()) return cancelled(s, "client cancelled the call");

    if (chunk_no == 0 && chunk.has_file_size_bytes() && chunk.file_size_bytes() > 0) {
      s.set_declared_size(chunk.file_size_bytes());
      log_info("session", concat(s.output_id(), ": declared file size ", chunk.file_size_bytes(), " bytes"));
    }
    ++chunk_no;

    if (!s.processor().process_chunk(chunk.data())) return failed(s);

    if (s.progress_due()) {
      if (!stream.write(status_update(s, "Aggregating sales data..."))) {
        return cancelled(s, "client stopped receiving progress");
      }
    }
  }
  if (stream.is_cancelled()) return cancelled(s, "client cancelled the call");

  if (!stream.write(finalizing_update(s))) return cancelled(s, "client stopped receiving progress");

  const auto stats = s.processor().finalize(s.destination(), s.uses_external_storage());
  if (!stats) return failed(s);

  const double elapsed = s.elapsed_seconds();
  log_info("session", concat(s.output_id(), ": stream processing complete in ", elapsed, " s; rows=",
                             stats->rows_processed, " malformed=", stats->malformed_rows, " bytes=",
                             stats->processed_bytes, " departments=", stats->unique_keys, " total=",
                             stats->total_measure));

  v1::ProgressUpdate u;
  auto* sum = u.mutable_summary();
  sum->set_result_file_name(s.output_id());
  sum->set_rows_processed(stats->rows_processed);
  sum->set_malformed_rows(stats->malformed_rows);
  sum->set_processed_percentage(100.0);
  sum->set_total_sales(stats->total_measure);
  sum->set_unique_departments(stats->unique_keys);
  sum->set_processing_time_seconds(elapsed);
  if (s.uses_external_storage()) {
    if (auto url = s.processor().storage_url(s.output_id())) {
      sum->set_storage_result_file_url(*url);
      log_info("session", concat(s.output_id(), ": result file accessible at ", *url));
    }
  }

  if (!stream.write(u)) {
    log_warn("session", concat(s.output_id(), ": summary could not be delivered"));
    return Status::Cancelled("client stopped receiving before the summary");
  }
  return Status::Ok();
}

}
