#include "csv_stream/http_gateway.hpp"
#include "csv_stream/ids.hpp"
#include "csv_stream/job_runner.hpp"
#include "csv_stream/job_store.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/path_utils.hpp"
#include "csv_stream/report_renderer.hpp"
#include "csv_stream/storage_backend.hpp"

#include <httplib.h>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cs {

static const char* kAllowedMethods = "GET, POST, OPTIONS";
static const char* kAllowedHeaders = "Content-Type, Authorization, Accept, Origin, X-Requested-With, X-API-Key";
static const char* kExposedHeaders = "Content-Disposition, Content-Length";

static void send_json(httplib::Response& res, int status, const std::string& body) {
  res.status = status;
  res.set_content(body, "application/json");
}

static void send_detail(httplib::Response& res, int status, const std::string& detail) {
  send_json(res, status, json_message("detail", detail));
}

static std::uint64_t parse_file_size(const std::string& s) {
  std::uint64_t v = 0;
  auto r = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || r.ec != std::errc() || r.ptr != s.data() + s.size()) {
    if (!s.empty()) log_warn("http", concat("invalid file size format: ", s));
    return 0;
  }
  return v;
}

struct HttpGateway::Impl {
  Config cfg;
  std::shared_ptr<JobStore> jobs;
  std::shared_ptr<JobRunner> runner;
  std::shared_ptr<StorageBackend> storage;
  ReportRenderer renderer;
  httplib::Server svr;
  int bound_port = -1;

  Impl(Config c, std::shared_ptr<JobStore> j, std::shared_ptr<JobRunner> r,
       std::shared_ptr<StorageBackend> s)
    : cfg(std::move(c)), jobs(std::move(j)), runner(std::move(r)), storage(std::move(s)),
      renderer(ReportRenderer::Config{cfg.template_dir, "job_report.mustache", "CSV Sales Processor"}) {}

  bool cors_allows(const std::string& origin) const {
    if (origin.empty()) return false;
    for (const auto& o : cfg.cors_origins) {
      if (o == "*" || o == origin) return true;
    }
    return false;
  }

  bool redirect_downloads() const {
    return storage && std::string(storage->kind()) != "local";
  }

  // Reads the request body into a spool file. Multipart: part "file" is the
  // upload and part "file_size_bytes" its declared size. Otherwise the raw
  // body is the upload and ?filename= names it.
  void handle_upload(const httplib::Request& req, httplib::Response& res,
                     const httplib::ContentReader& reader) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.upload_dir, ec);
    if (ec) {
      log_error("http", concat("cannot create upload dir ", cfg.upload_dir, ": ", ec.message()));
      send_detail(res, 500, "Internal server error during upload processing");
      return;
    }

    const std::string job_id = new_uuid4();
    const std::filesystem::path spool = std::filesystem::path(cfg.upload_dir) / (job_id + ".upload");

    std::ofstream out;
    std::string filename;
    std::string size_field;
    std::string current_part;
    bool in_upload_part = false;
    bool have_file = false;
    bool write_failed = false;

    auto write_chunk = [&](const char* data, size_t len) {
      if (!out.is_open()) return true;
      out.write(data, static_cast<std::streamsize>(len));
      if (!out) write_failed = true;
      return !write_failed;
    };

    bool read_ok = true;
    if (req.is_multipart_form_data()) {
      read_ok = reader(
          [&](const httplib::MultipartFormData& part) {
            current_part = part.name;
            // only the first "file" part is the upload; later ones are skipped
            in_upload_part = part.name == "file" && !have_file;
            if (in_upload_part) {
              have_file = true;
              filename = part.filename;
              if (!filename.empty() && ends_with_ci(filename, ".csv")) {
                out.open(spool, std::ios::binary | std::ios::trunc);
                if (!out) write_failed = true;
              }
            }
            return !write_failed;
          },
          [&](const char* data, size_t len) {
            if (in_upload_part) return write_chunk(data, len);
            if (current_part == "file_size_bytes" && size_field.size() < 32) size_field.append(data, len);
            return true;
          });
    } else {
      have_file = true;
      filename = req.has_param("filename") ? req.get_param_value("filename") : std::string();
      if (!filename.empty() && ends_with_ci(filename, ".csv")) {
        out.open(spool, std::ios::binary | std::ios::trunc);
        if (!out) write_failed = true;
      }
      if (req.has_param("file_size_bytes")) size_field = req.get_param_value("file_size_bytes");
      read_ok = reader([&](const char* data, size_t len) { return write_chunk(data, len); });
    }
    const bool spooled = out.is_open();
    if (spooled) out.close();

    auto discard = [&] {
      std::error_code rm;
      std::filesystem::remove(spool, rm);
    };

    if (!have_file || filename.empty()) {
      discard();
      send_detail(res, 400, "Missing file in upload.");
      return;
    }
    if (!ends_with_ci(filename, ".csv")) {
      discard();
      send_detail(res, 400, "Only CSV files are allowed.");
      return;
    }
    if (write_failed) {
      discard();
      log_error("http", concat("spool write failed: ", spool.string()));
      send_detail(res, 500, "Internal server error during upload processing");
      return;
    }
    if (!read_ok || !spooled) {
      discard();
      send_detail(res, 400, "Invalid form data or missing 'file' part.");
      return;
    }

    JobRecord r;
    r.job_id = job_id;
    r.filename = filename;
    r.file_size_bytes = parse_file_size(size_field);
    r.status = JobStatus::Uploading;
    jobs->put(r);

    JobTicket t{job_id, spool.string(), r.file_size_bytes};
    if (!runner->submit(std::move(t))) {
      discard();
      jobs->update(job_id, [](JobRecord& j) {
        j.status = JobStatus::Failed;
        j.error = "job queue is full";
      });
      send_detail(res, 503, "Server is busy, try again later.");
      return;
    }

    log_info("http", concat("job ", job_id, " created for file: ", filename));
    send_json(res, 202, json_message("job_id", job_id));
  }

  void handle_download(const std::string& filename, httplib::Response& res) {
    std::string why;
    if (!is_safe_result_filename(filename, &why)) {
      send_detail(res, 400, why);
      return;
    }

    if (redirect_downloads()) {
      if (!storage->exists(filename)) {
        send_detail(res, 404, "Result file not found.");
        return;
      }
      res.set_redirect(storage->url_for(filename), 302);
      return;
    }

    std::error_code ec;
    const std::filesystem::path root(cfg.results_dir);
    if (!std::filesystem::is_directory(root, ec)) {
      send_detail(res, 500, "Results directory not available.");
      return;
    }
    auto path = confine_under(root, filename);
    if (!path) {
      send_detail(res, 400, "Invalid file path.");
      return;
    }
    if (!std::filesystem::is_regular_file(*path, ec)) {
      send_detail(res, 404, "Result file not found.");
      return;
    }
    const auto size = std::filesystem::file_size(*path, ec);
    if (ec) {
      send_detail(res, 404, "Result file not found.");
      return;
    }

    std::string download_name = "Processed_results.csv";
    if (auto job = jobs->find_by_result(filename)) {
      download_name = "Processed_" + safe_stem(job->filename) + "_" + std::to_string(unix_now()) + ".csv";
    }

    auto in = std::make_shared<std::ifstream>(*path, std::ios::binary);
    if (!*in) {
      send_detail(res, 404, "Result file not found.");
      return;
    }
    res.set_header("Content-Disposition", "attachment; filename=\"" + download_name + "\"");
    res.set_header("Cache-Control", "no-cache");
    res.set_content_provider(
        static_cast<size_t>(size), "text/csv",
        [in](size_t offset, size_t length, httplib::DataSink& sink) {
          char buf[64 * 1024];
          in->seekg(static_cast<std::streamoff>(offset));
          const size_t want = std::min(length, sizeof(buf));
          in->read(buf, static_cast<std::streamsize>(want));
          const auto got = in->gcount();
          if (got <= 0) return false;
          sink.write(buf, static_cast<size_t>(got));
          return true;
        });
  }

  void routes() {
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
      log_info("http", concat(req.method, " ", req.path, " -> ", res.status));
    });

    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
      if (!cfg.require_api_key || req.method == "OPTIONS") return httplib::Server::HandlerResponse::Unhandled;
      const std::string key = req.get_header_value("X-API-Key");
      if (key.empty()) {
        log_warn("auth", concat("missing API key for ", req.method, " ", req.path));
        send_detail(res, 401, "API key required");
        return httplib::Server::HandlerResponse::Handled;
      }
      if (cfg.api_key.empty()) {
        log_error("auth", "API key required but none configured");
        send_detail(res, 500, "Server configuration error");
        return httplib::Server::HandlerResponse::Handled;
      }
      if (key != cfg.api_key) {
        log_warn("auth", concat("invalid API key attempt for ", req.method, " ", req.path));
        send_detail(res, 401, "Invalid API key");
        return httplib::Server::HandlerResponse::Handled;
      }
      return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
      const std::string origin = req.get_header_value("Origin");
      if (!cors_allows(origin)) return;
      res.set_header("Access-Control-Allow-Origin", origin);
      res.set_header("Access-Control-Allow-Credentials", "true");
      res.set_header("Access-Control-Expose-Headers", kExposedHeaders);
      res.set_header("Vary", "Origin");
      if (req.method == "OPTIONS") {
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
        res.set_header("Access-Control-Max-Age", "600");
      }
    });

    svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
      res.status = 204;
    });

    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
      send_json(res, 200, json_message("message", "gRPC CSV Processor Gateway is running."));
    });

    svr.Post("/upload", [this](const httplib::Request& req, httplib::Response& res,
                               const httplib::ContentReader& reader) {
      try {
        handle_upload(req, res, reader);
      } catch (const std::exception& e) {
        log_error("http", concat("unexpected error during upload: ", e.what()));
        send_detail(res, 500, "Internal server error during upload processing");
      }
    });

    svr.Get(R"(/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
      const std::string id = req.matches[1].str();
      auto job = jobs->get(id);
      if (!job) {
        send_detail(res, 404, "Job ID " + id + " not found.");
        return;
      }
      send_json(res, 200, job_to_json(*job));
    });

    svr.Get(R"(/download/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
      handle_download(req.matches[1].str(), res);
    });

    svr.Get(R"(/jobs/([^/]+)/report)", [this](const httplib::Request& req, httplib::Response& res) {
      const std::string id = req.matches[1].str();
      auto job = jobs->get(id);
      if (!job) {
        send_detail(res, 404, "Job ID " + id + " not found.");
        return;
      }
      std::string html;
      if (!renderer.render_job(*job, &html)) {
        log_error("http", concat("report render failed: ", renderer.error()));
        send_detail(res, 500, "Report rendering failed");
        return;
      }
      res.set_content(html, "text/html; charset=utf-8");
    });
  }
};

HttpGateway::HttpGateway(Config cfg, std::shared_ptr<JobStore> jobs, std::shared_ptr<JobRunner> runner,
                         std::shared_ptr<StorageBackend> storage)
  : p_(new Impl(std::move(cfg), std::move(jobs), std::move(runner), std::move(storage))) {
  p_->routes();
}
HttpGateway::~HttpGateway() {
  stop();
  delete p_;
}

bool HttpGateway::start() {
  if (p_->bound_port > 0) return true;
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
  } else {
    p_->bound_port = p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port) ? p_->cfg.port : -1;
  }
  if (p_->bound_port <= 0) {
    log_error("http", concat("cannot bind ", p_->cfg.host, ":", p_->cfg.port));
    return false;
  }
  log_info("http", concat("gateway listening on ", p_->cfg.host, ":", p_->bound_port));
  return true;
}

int HttpGateway::port() const { return p_->bound_port; }

int HttpGateway::run() {
  if (!start()) return -1;
  return p_->svr.listen_after_bind() ? 0 : -1;
}

void HttpGateway::stop() {
  if (p_->svr.is_running()) p_->svr.stop();
}

}
