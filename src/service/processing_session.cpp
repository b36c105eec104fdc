#include "csv_stream/processing_session.hpp"
#include "csv_stream/ids.hpp"
#include <algorithm>
#include <cmath>

namespace cs {

ProcessingSession::ProcessingSession(const Config& cfg, StorageBackend* storage, NowFn now)
  : cfg_(cfg),
    storage_(storage),
    now_(now ? std::move(now) : NowFn([]{ return Clock::now(); })),
    processor_(cfg.processor, storage),
    output_id_(new_uuid4() + ".csv") {
  start_ = now_();
  last_progress_ = start_;
}

bool ProcessingSession::progress_due() {
  const auto t = now_();
  const double since = std::chrono::duration<double>(t - last_progress_).count();
  if (since < cfg_.progress_interval_s) return false;
  last_progress_ = t;
  return true;
}

double ProcessingSession::percent_complete() const {
  if (!declared_size_ || *declared_size_ == 0) return 0.0;
  const double pct = static_cast<double>(processor_.stats().processed_bytes) /
                     static_cast<double>(*declared_size_) * 100.0;
  return std::round(std::clamp(pct, 0.0, 100.0) * 100.0) / 100.0;
}

double ProcessingSession::elapsed_seconds() const {
  return std::chrono::duration<double>(now_() - start_).count();
}

std::string ProcessingSession::destination() const {
  if (storage_) return output_id_;
  return (cfg_.results_dir / output_id_).string();
}

}
