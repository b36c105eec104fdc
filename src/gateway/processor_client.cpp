#include "csv_stream/processor_client.hpp"
#include <fstream>
#include <vector>

namespace cs {

namespace v1 = csv_stream::v1;

const char* const kMissingSummaryMessage =
    "stream closed unexpectedly before receiving final summary";

bool for_each_file_chunk(const std::string& path, std::size_t chunk_size,
                         const std::function<bool(std::string_view)>& fn,
                         std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "open failed: " + path;
    return false;
  }
  std::vector<char> buf(chunk_size ? chunk_size : 1);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in.gcount();
    if (got <= 0) break;
    if (!fn(std::string_view(buf.data(), static_cast<std::size_t>(got)))) return true;
  }
  if (in.bad()) {
    if (err) *err = "read failed: " + path;
    return false;
  }
  return true;
}

namespace {

// Feeds the service from a spool file and hands responses straight to the events.
class SpoolStream final : public ServerStream {
public:
  SpoolStream(const std::string& path, std::size_t chunk_size, std::uint64_t declared_size,
              const ProcessorEvents& events)
    : in_(path, std::ios::binary), buf_(chunk_size ? chunk_size : 1),
      declared_(declared_size), events_(events) {
    if (!in_) io_error_ = "open failed: " + path;
  }

  bool read(v1::CsvChunk* chunk) override {
    if (!io_error_.empty() || !in_) return false;
    in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    const std::streamsize got = in_.gcount();
    if (got <= 0) {
      if (in_.bad()) io_error_ = "read failed while streaming upload";
      return false;
    }
    chunk->Clear();
    chunk->set_data(buf_.data(), static_cast<std::size_t>(got));
    if (first_) {
      chunk->set_file_size_bytes(declared_);
      first_ = false;
    }
    return true;
  }

  bool write(const v1::ProgressUpdate& update) override {
    if (update.has_status_update()) {
      if (events_.on_status) events_.on_status(update.status_update());
    } else if (update.has_summary()) {
      summary_seen_ = true;
      if (events_.on_summary) events_.on_summary(update.summary());
    }
    return true;
  }

  bool is_cancelled() const override { return !io_error_.empty(); }

  const std::string& io_error() const { return io_error_; }
  bool summary_seen() const { return summary_seen_; }

private:
  std::ifstream in_;
  std::vector<char> buf_;
  std::uint64_t declared_;
  const ProcessorEvents& events_;
  bool first_ = true;
  bool summary_seen_ = false;
  std::string io_error_;
};

}

InProcessClient::InProcessClient(std::shared_ptr<const StreamingService> service, std::size_t chunk_size)
  : service_(std::move(service)), chunk_size_(chunk_size) {}

Status InProcessClient::process_file(const std::string& path, std::uint64_t declared_size,
                                     const ProcessorEvents& events) {
  SpoolStream stream(path, chunk_size_, declared_size, events);
  if (!stream.io_error().empty()) return Status::Internal(stream.io_error());

  Status st = service_->process_csv(stream);
  if (!stream.io_error().empty()) return Status::Internal(stream.io_error());
  if (st.ok() && !stream.summary_seen()) return Status::Internal(kMissingSummaryMessage);
  return st;
}

}
