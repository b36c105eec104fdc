#pragma once
#include "csv_stream/line_assembler.hpp"
#include "csv_stream/processing_stats.hpp"
#include "csv_stream/row_aggregator.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

class StorageBackend;

inline constexpr std::string_view kResultKeyColumn   = "Department Name";
inline constexpr std::string_view kResultValueColumn = "Total Number of Sales";

// Chunked CSV in, per-key sums out. Memory is O(unique keys + one line),
// independent of file size.
//
//   CollectingHeader --header line--> Aggregating --finalize()--> Finalized
class StreamProcessor {
public:
  enum class State { CollectingHeader, Aggregating, Finalized };

  struct Config {
    LineAssembler::Config assembler;
    RowAggregator::Config rows;
  };

  explicit StreamProcessor(StorageBackend* storage = nullptr);
  StreamProcessor(Config cfg, StorageBackend* storage);
  ~StreamProcessor();

  StreamProcessor(const StreamProcessor&) = delete;
  StreamProcessor& operator=(const StreamProcessor&) = delete;

  // Malformed rows are counted, not reported. false means the stream is
  // unusable: error() starts with "Chunk processing failed:".
  bool process_chunk(std::string_view bytes);

  // Flushes the held partial row, then writes the sorted result either to the
  // local file `destination` or, with `use_external_storage` and a backend,
  // through StorageBackend::save. One-shot. On failure error() starts with
  // "Finalization failed:".
  std::optional<ProcessingStats> finalize(const std::string& destination,
                                          bool use_external_storage);

  ProcessingStats stats() const;
  State state() const noexcept;

  const RowAggregator::Totals& totals() const noexcept;
  std::vector<std::pair<std::string, std::int64_t>> sorted_totals() const;

  // Result file body: header plus one row per key in ascending key order.
  std::string render_csv() const;

  std::optional<std::string> storage_url(const std::string& path) const;

  // Drops all aggregated state; used when the caller walks away mid-stream.
  void release();

  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
