#pragma once
#include "csv_stream/bounded_queue.hpp"
#include "csv_stream/job_store.hpp"
#include "csv_stream/processor_client.hpp"
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace cs {

struct JobTicket {
  std::string job_id;
  std::string spool_path;
  std::uint64_t declared_size = 0;
};

// Fixed pool of workers draining a bounded queue of uploaded files through a ProcessorClient.
class JobRunner {
public:
  struct Config {
    int workers = 5;
    std::size_t queue_capacity = 256;
    bool remove_spool = true;
  };

  JobRunner(Config cfg, std::shared_ptr<JobStore> jobs, std::shared_ptr<ProcessorClient> client);
  ~JobRunner();

  JobRunner(const JobRunner&) = delete;
  JobRunner& operator=(const JobRunner&) = delete;

  // False when the queue is full or the runner is stopping.
  bool submit(JobTicket t);

  // Runs one ticket on the calling thread.
  void run_one(const JobTicket& t);

  // Stops accepting work, finishes queued jobs, joins workers. Idempotent.
  void stop();

  std::size_t pending() const { return queue_.size(); }

private:
  void worker_loop(int idx);

  Config cfg_;
  std::shared_ptr<JobStore> jobs_;
  std::shared_ptr<ProcessorClient> client_;
  BoundedQueue<JobTicket> queue_;
  std::vector<std::thread> workers_;
  bool stopped_ = false;
};

}
