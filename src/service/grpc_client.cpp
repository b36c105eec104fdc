#include "csv_stream/grpc_client.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/v1/processing.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <thread>

namespace cs {

namespace v1 = csv_stream::v1;

static Status from_grpc_status(const grpc::Status& s) {
  switch (s.error_code()) {
    case grpc::StatusCode::OK:               return Status::Ok();
    case grpc::StatusCode::CANCELLED:        return Status::Cancelled(s.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT: return {StatusCode::InvalidArgument, s.error_message()};
    default:                                 return Status::Internal(s.error_message());
  }
}

struct GrpcProcessorClient::Impl {
  std::string address;
  std::size_t chunk_size;
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<v1::CsvProcessor::Stub> stub;

  Impl(std::string a, std::size_t cs)
    : address(std::move(a)), chunk_size(cs),
      channel(grpc::CreateChannel(address, grpc::InsecureChannelCredentials())),
      stub(v1::CsvProcessor::NewStub(channel)) {}
};

GrpcProcessorClient::GrpcProcessorClient(std::string address, std::size_t chunk_size)
  : p_(new Impl(std::move(address), chunk_size)) {}
GrpcProcessorClient::~GrpcProcessorClient() { delete p_; }

const std::string& GrpcProcessorClient::address() const noexcept { return p_->address; }

Status GrpcProcessorClient::process_file(const std::string& path, std::uint64_t declared_size,
                                         const ProcessorEvents& events) {
  log_info("client", concat("connecting to gRPC server at ", p_->address));
  grpc::ClientContext ctx;
  auto rw = p_->stub->ProcessCsv(&ctx);

  // Chunks go out on their own thread so progress is consumed while uploading.
  std::string read_err;
  bool read_ok = true;
  std::thread writer([&] {
    bool first = true;
    read_ok = for_each_file_chunk(path, p_->chunk_size, [&](std::string_view data) {
      v1::CsvChunk chunk;
      chunk.set_data(data.data(), data.size());
      if (first) {
        chunk.set_file_size_bytes(declared_size);
        first = false;
      }
      return rw->Write(chunk);
    }, &read_err);
    if (!read_ok) ctx.TryCancel();
    rw->WritesDone();
  });

  bool summary_seen = false;
  v1::ProgressUpdate update;
  while (rw->Read(&update)) {
    if (update.has_status_update()) {
      if (events.on_status) events.on_status(update.status_update());
    } else if (update.has_summary()) {
      summary_seen = true;
      if (events.on_summary) events.on_summary(update.summary());
    }
  }
  writer.join();
  const grpc::Status st = rw->Finish();

  if (!read_ok) return Status::Internal(read_err);
  if (!st.ok()) {
    log_warn("client", concat("ProcessCsv failed: ", st.error_message()));
    return from_grpc_status(st);
  }
  if (!summary_seen) return Status::Internal(kMissingSummaryMessage);
  return Status::Ok();
}

}
