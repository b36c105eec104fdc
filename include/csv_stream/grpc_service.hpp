#pragma once
#include "csv_stream/streaming_service.hpp"
#include "csv_stream/v1/processing.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace cs {

grpc::Status to_grpc_status(const Status& s);

// gRPC binding of StreamingService. Each call runs on a server thread of its own.
class CsvProcessorService final : public csv_stream::v1::CsvProcessor::Service {
public:
  explicit CsvProcessorService(std::shared_ptr<const StreamingService> service);

  grpc::Status ProcessCsv(grpc::ServerContext* context,
                          grpc::ServerReaderWriter<csv_stream::v1::ProgressUpdate,
                                                   csv_stream::v1::CsvChunk>* stream) override;

private:
  std::shared_ptr<const StreamingService> service_;
};

class GrpcServer {
public:
  struct Config {
    std::string listen_address = "0.0.0.0:50051";
    int max_workers = 20;
  };

  GrpcServer(Config cfg, std::shared_ptr<const StreamingService> service);
  ~GrpcServer();

  GrpcServer(const GrpcServer&) = delete;
  GrpcServer& operator=(const GrpcServer&) = delete;

  // Non-blocking; false when the port could not be bound.
  bool start();

  // Port actually bound (useful with ":0").
  int port() const noexcept;

  // Blocks until shutdown() is called from another thread.
  void wait();

  void shutdown();

private:
  struct Impl; Impl* p_;
};

}
