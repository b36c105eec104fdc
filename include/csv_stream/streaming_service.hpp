#pragma once
#include "csv_stream/processing_session.hpp"
#include "csv_stream/v1/processing.pb.h"
#include <memory>
#include <string>
#include <utility>

namespace cs {

class StorageBackend;

enum class StatusCode { Ok, Cancelled, InvalidArgument, Internal };

struct Status {
  StatusCode code = StatusCode::Ok;
  std::string message;

  bool ok() const noexcept { return code == StatusCode::Ok; }
  static Status Ok() { return {}; }
  static Status Cancelled(std::string m) { return {StatusCode::Cancelled, std::move(m)}; }
  static Status Internal(std::string m) { return {StatusCode::Internal, std::move(m)}; }
};

const char* to_string(StatusCode c) noexcept;

// The transport side of one ProcessCsv call.
class ServerStream {
public:
  virtual ~ServerStream() = default;

  // Next inbound chunk; false once the client has finished sending.
  virtual bool read(csv_stream::v1::CsvChunk* chunk) = 0;

  // false when the peer can no longer receive.
  virtual bool write(const csv_stream::v1::ProgressUpdate& update) = 0;

  virtual bool is_cancelled() const { return false; }
};

// Drives ProcessingSession over a ServerStream: throttled status updates while
// chunks arrive, then one "finalizing" update, then exactly one summary.
// Any fault ends the call with StatusCode::Internal and no summary.
class StreamingService {
public:
  struct Config {
    ProcessingSession::Config session;
  };

  StreamingService(Config cfg, std::shared_ptr<StorageBackend> storage,
                   ProcessingSession::NowFn now = {});

  Status process_csv(ServerStream& stream) const;

  const Config& config() const noexcept { return cfg_; }
  StorageBackend* storage() const noexcept { return storage_.get(); }

private:
  Config cfg_;
  std::shared_ptr<StorageBackend> storage_;
  ProcessingSession::NowFn now_;
};

}
