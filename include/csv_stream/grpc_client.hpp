#pragma once
#include "csv_stream/processor_client.hpp"
#include <cstddef>
#include <string>

namespace cs {

// ProcessCsv against a remote processor over an insecure channel.
class GrpcProcessorClient final : public ProcessorClient {
public:
  GrpcProcessorClient(std::string address, std::size_t chunk_size);
  ~GrpcProcessorClient() override;
  GrpcProcessorClient(const GrpcProcessorClient&) = delete;
  GrpcProcessorClient& operator=(const GrpcProcessorClient&) = delete;

  Status process_file(const std::string& path, std::uint64_t declared_size,
                      const ProcessorEvents& events) override;
  const char* kind() const noexcept override { return "grpc"; }

  const std::string& address() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
