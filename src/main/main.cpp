#include "csv_stream/config.hpp"
#include "csv_stream/grpc_client.hpp"
#include "csv_stream/grpc_service.hpp"
#include "csv_stream/http_gateway.hpp"
#include "csv_stream/job_runner.hpp"
#include "csv_stream/job_store.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/processor_client.hpp"
#include "csv_stream/storage_backend.hpp"
#include "csv_stream/streaming_service.hpp"

#include <csignal>
#include <pthread.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace {

std::shared_ptr<const cs::StreamingService> make_service(const cs::AppConfig& cfg,
                                                         std::shared_ptr<cs::StorageBackend> storage) {
  cs::StreamingService::Config sc;
  sc.session.progress_interval_s = cfg.progress_interval_s;
  sc.session.results_dir = cfg.results_dir;
  sc.session.processor.assembler.max_line_bytes = cfg.max_line_bytes;
  return std::make_shared<const cs::StreamingService>(sc, std::move(storage));
}

std::unique_ptr<cs::GrpcServer> start_processor(const cs::AppConfig& cfg,
                                                std::shared_ptr<const cs::StreamingService> svc) {
  cs::GrpcServer::Config gc;
  gc.listen_address = cfg.grpc_listen;
  gc.max_workers = cfg.grpc_max_workers;
  auto server = std::make_unique<cs::GrpcServer>(gc, std::move(svc));
  if (!server->start()) return nullptr;
  return server;
}

void log_config(const cs::AppConfig& cfg, const cs::StorageBackend* storage) {
  cs::log_info("main", cs::concat("mode: ", cs::to_string(cfg.mode), ", environment: ", cfg.environment));
  cs::log_info("main", cs::concat("results directory: ", cfg.results_dir, ", storage: ",
                                  (storage ? storage->kind() : "none")));
  if (cfg.mode != cs::AppConfig::Mode::Processor) {
    cs::log_info("main", cs::concat("gateway: ", cfg.gateway_host, ":", cfg.gateway_port, ", chunk size: ",
                                    cfg.chunk_size, " bytes"));
  }
  if (cfg.mode != cs::AppConfig::Mode::Gateway) {
    cs::log_info("main", cs::concat("gRPC server: ", cfg.grpc_listen, ", max workers ",
                                    cfg.grpc_max_workers));
  }
}

}

int main(int argc, char** argv) {
  cs::AppConfig cfg;
  cs::CliResult cli;
  std::string err;
  if (!cs::load_config(argc, argv, [](const char* k) { return std::getenv(k); }, cfg, &cli, &err)) {
    std::cerr << "[config] " << err << "\n" << cs::usage_text();
    return 2;
  }
  if (cli.help) {
    std::cout << cs::usage_text();
    return 0;
  }

  cs::LogLevel lvl = cs::LogLevel::Info;
  if (!cs::parse_log_level(cfg.log_level, &lvl)) {
    cs::log_warn("main", "unknown log level '" + cfg.log_level + "', using info");
  }
  cs::set_log_level(lvl);

  // Signals are taken synchronously by a watcher thread; every other thread inherits the mask.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  std::shared_ptr<cs::StorageBackend> storage;
  if (auto sc = cfg.storage_config()) {
    storage = cs::make_storage(*sc, &err);
    if (!storage) {
      cs::log_error("main", cs::concat("storage setup failed: ", err));
      return 2;
    }
  }
  log_config(cfg, storage.get());

  std::error_code ec;
  std::filesystem::create_directories(cfg.results_dir, ec);
  if (ec) cs::log_warn("main", cs::concat("cannot create ", cfg.results_dir, ": ", ec.message()));

  auto service = make_service(cfg, storage);

  std::unique_ptr<cs::GrpcServer> grpc_server;
  if (cfg.mode != cs::AppConfig::Mode::Gateway) {
    grpc_server = start_processor(cfg, service);
    if (!grpc_server) return 1;
  }

  std::shared_ptr<cs::JobRunner> runner;
  std::unique_ptr<cs::HttpGateway> gateway;
  if (cfg.mode != cs::AppConfig::Mode::Processor) {
    auto jobs = std::make_shared<cs::InMemoryJobStore>(
        cs::InMemoryJobStore::Config{static_cast<double>(cfg.job_ttl_s)});

    std::shared_ptr<cs::ProcessorClient> client;
    if (cfg.processor_address.empty()) {
      client = std::make_shared<cs::InProcessClient>(service, cfg.chunk_size);
    } else {
      client = std::make_shared<cs::GrpcProcessorClient>(cfg.processor_address, cfg.chunk_size);
    }

    cs::JobRunner::Config rc;
    rc.workers = cfg.gateway_workers;
    runner = std::make_shared<cs::JobRunner>(rc, jobs, client);

    cs::HttpGateway::Config hc;
    hc.host = cfg.gateway_host;
    hc.port = cfg.gateway_port;
    hc.upload_dir = cfg.upload_dir;
    hc.results_dir = cfg.results_dir;
    hc.template_dir = cfg.template_dir;
    hc.require_api_key = cfg.require_api_key;
    hc.api_key = cfg.api_key;
    hc.cors_origins = cfg.effective_cors_origins();
    if (hc.require_api_key && hc.api_key.empty()) {
      cs::log_warn("main", "API key required but API_KEY is not set; requests will be refused");
    }
    gateway = std::make_unique<cs::HttpGateway>(hc, jobs, runner, storage);
    if (!gateway->start()) return 1;
  }

  std::thread watcher([&] {
    int sig = 0;
    sigwait(&sigs, &sig);
    cs::log_info("main", cs::concat("signal ", sig, " received, shutting down"));
    if (gateway) gateway->stop();
    if (grpc_server) grpc_server->shutdown();
  });

  int rc = 0;
  if (gateway) {
    rc = gateway->run();
    if (grpc_server) grpc_server->shutdown();
  } else {
    grpc_server->wait();
  }

  // wake the watcher if we got here without a signal
  pthread_kill(watcher.native_handle(), SIGTERM);
  watcher.join();

  if (runner) runner->stop();
  cs::log_info("main", "bye");
  return rc;
}
