#include "csv_stream/grpc_service.hpp"
#include "csv_stream/log.hpp"
#include <grpcpp/resource_quota.h>
#include <chrono>

namespace cs {

namespace v1 = csv_stream::v1;

grpc::Status to_grpc_status(const Status& s) {
  switch (s.code) {
    case StatusCode::Ok:              return grpc::Status::OK;
    case StatusCode::Cancelled:       return grpc::Status(grpc::StatusCode::CANCELLED, s.message);
    case StatusCode::InvalidArgument: return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, s.message);
    case StatusCode::Internal:        return grpc::Status(grpc::StatusCode::INTERNAL, s.message);
  }
  return grpc::Status(grpc::StatusCode::UNKNOWN, s.message);
}

namespace {

class GrpcServerStream final : public ServerStream {
public:
  GrpcServerStream(grpc::ServerContext* ctx,
                   grpc::ServerReaderWriter<v1::ProgressUpdate, v1::CsvChunk>* rw)
    : ctx_(ctx), rw_(rw) {}

  bool read(v1::CsvChunk* chunk) override { return rw_->Read(chunk); }
  bool write(const v1::ProgressUpdate& update) override { return rw_->Write(update); }
  bool is_cancelled() const override { return ctx_->IsCancelled(); }

private:
  grpc::ServerContext* ctx_;
  grpc::ServerReaderWriter<v1::ProgressUpdate, v1::CsvChunk>* rw_;
};

}

CsvProcessorService::CsvProcessorService(std::shared_ptr<const StreamingService> service)
  : service_(std::move(service)) {}

grpc::Status CsvProcessorService::ProcessCsv(
    grpc::ServerContext* context,
    grpc::ServerReaderWriter<v1::ProgressUpdate, v1::CsvChunk>* stream) {
  log_info("grpc", concat("ProcessCsv from ", context->peer()));
  GrpcServerStream adapter(context, stream);
  return to_grpc_status(service_->process_csv(adapter));
}

struct GrpcServer::Impl {
  Config cfg;
  CsvProcessorService service;
  std::unique_ptr<grpc::Server> server;
  int bound_port{0};
  bool stopped{false};

  Impl(Config c, std::shared_ptr<const StreamingService> svc)
    : cfg(std::move(c)), service(std::move(svc)) {}
};

GrpcServer::GrpcServer(Config cfg, std::shared_ptr<const StreamingService> service)
  : p_(new Impl(std::move(cfg), std::move(service))) {}

GrpcServer::~GrpcServer() {
  shutdown();
  delete p_;
}

bool GrpcServer::start() {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(p_->cfg.listen_address, grpc::InsecureServerCredentials(), &p_->bound_port);
  builder.RegisterService(&p_->service);

  // caps concurrent sessions: one sync handler thread per active call
  grpc::ResourceQuota quota("csv-stream");
  quota.SetMaxThreads(p_->cfg.max_workers > 0 ? p_->cfg.max_workers + 1 : 2);
  builder.SetResourceQuota(quota);

  p_->server = builder.BuildAndStart();
  if (!p_->server || p_->bound_port == 0) {
    log_error("grpc", concat("failed to start gRPC server on ", p_->cfg.listen_address));
    p_->server.reset();
    return false;
  }
  log_info("grpc", concat("gRPC server started on port ", p_->bound_port, " (max workers ",
                          p_->cfg.max_workers, ")"));
  return true;
}

int GrpcServer::port() const noexcept { return p_->bound_port; }

void GrpcServer::wait() {
  if (p_->server) p_->server->Wait();
}

void GrpcServer::shutdown() {
  if (!p_->server || p_->stopped) return;
  p_->stopped = true;
  p_->server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  log_info("grpc", "gRPC server stopped");
}

}
