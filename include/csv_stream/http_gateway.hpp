#pragma once
#include <memory>
#include <string>
#include <vector>

namespace cs {

class JobRunner;
class JobStore;
class StorageBackend;

// cpp-httplib front end: uploads are spooled to disk and handed to a JobRunner;
// status, download and report pages read the JobStore.
class HttpGateway {
public:
  struct Config {
    std::string host = "127.0.0.1";
    int port = 8000;                         // 0 binds any free port
    std::string upload_dir = "uploads";
    std::string results_dir = "results";
    std::string template_dir = "templates";
    bool require_api_key = true;
    std::string api_key;
    std::vector<std::string> cors_origins;   // {"*"} allows any origin
  };

  // `storage` may be null (results are local files under results_dir).
  HttpGateway(Config cfg, std::shared_ptr<JobStore> jobs, std::shared_ptr<JobRunner> runner,
              std::shared_ptr<StorageBackend> storage);
  ~HttpGateway();

  HttpGateway(const HttpGateway&) = delete;
  HttpGateway& operator=(const HttpGateway&) = delete;

  // Non-blocking bind; returns false on bind error.
  bool start();

  // Port actually bound after start().
  int port() const;

  // Blocking run (binds first if needed); returns when stopped.
  int run();

  void stop();

private:
  struct Impl;
  Impl* p_;
};

}
