#pragma once
#include "csv_stream/stream_processor.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace cs {

class StorageBackend;

// State of one ProcessCsv call: its processor, timing, declared size and output name.
// Owned by the thread serving the call; never shared.
class ProcessingSession {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  struct Config {
    double progress_interval_s = 1.0;
    std::filesystem::path results_dir = "results";
    StreamProcessor::Config processor;
  };

  // `storage` may be null (local files under results_dir). `now` defaults to steady_clock.
  ProcessingSession(const Config& cfg, StorageBackend* storage, NowFn now = {});

  StreamProcessor& processor() noexcept { return processor_; }
  const StreamProcessor& processor() const noexcept { return processor_; }

  void set_declared_size(std::uint64_t bytes) noexcept { declared_size_ = bytes; }
  std::optional<std::uint64_t> declared_size() const noexcept { return declared_size_; }

  // True at most once per interval; arms the next interval when it fires.
  bool progress_due();

  // processed/declared * 100, clamped to [0, 100] and rounded to 2 decimals; 0 without a size.
  double percent_complete() const;

  double elapsed_seconds() const;

  const std::string& output_id() const noexcept { return output_id_; }
  bool uses_external_storage() const noexcept { return storage_ != nullptr; }

  // Local file path, or the storage key when an external backend is configured.
  std::string destination() const;

private:
  Config cfg_;
  StorageBackend* storage_;
  NowFn now_;
  StreamProcessor processor_;
  Clock::time_point start_;
  Clock::time_point last_progress_;
  std::optional<std::uint64_t> declared_size_;
  std::string output_id_;
};

}
