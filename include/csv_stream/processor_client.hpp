#pragma once
#include "csv_stream/streaming_service.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace cs {

// Reads `path` in pieces of at most `chunk_size` bytes. `fn` returns false to stop early.
// False (with `err`) when the file cannot be opened or read.
bool for_each_file_chunk(const std::string& path, std::size_t chunk_size,
                         const std::function<bool(std::string_view)>& fn,
                         std::string* err);

struct ProcessorEvents {
  std::function<void(const csv_stream::v1::ProcessingStatus&)> on_status;
  std::function<void(const csv_stream::v1::ProcessSummary&)> on_summary;
};

// Client half of ProcessCsv as seen by the gateway.
class ProcessorClient {
public:
  virtual ~ProcessorClient() = default;

  // Streams the file; `declared_size` rides on the first chunk. Ok only when a
  // summary arrived; a clean end without one is reported as Internal.
  virtual Status process_file(const std::string& path, std::uint64_t declared_size,
                              const ProcessorEvents& events) = 0;

  virtual const char* kind() const noexcept = 0;
};

extern const char* const kMissingSummaryMessage;

// Runs the StreamingService on the calling thread.
class InProcessClient final : public ProcessorClient {
public:
  InProcessClient(std::shared_ptr<const StreamingService> service, std::size_t chunk_size);

  Status process_file(const std::string& path, std::uint64_t declared_size,
                      const ProcessorEvents& events) override;
  const char* kind() const noexcept override { return "in-process"; }

private:
  std::shared_ptr<const StreamingService> service_;
  std::size_t chunk_size_;
};

}
