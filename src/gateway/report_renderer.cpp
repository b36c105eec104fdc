#include "csv_stream/report_renderer.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace cs {

ReportRenderer::ReportRenderer() : cfg_{} {}
ReportRenderer::ReportRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const std::filesystem::path& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  *out = ss.str();
  return true;
}

static std::string fixed2(double v) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << v;
  return o.str();
}

std::string ReportRenderer::load_template() {
  std::vector<std::filesystem::path> candidates;
  candidates.emplace_back(std::filesystem::path(cfg_.template_dir) / cfg_.template_name);
#ifdef CS_DEFAULT_TEMPLATE_DIR
  candidates.emplace_back(std::filesystem::path(CS_DEFAULT_TEMPLATE_DIR) / cfg_.template_name);
#endif
  std::string tpl;
  for (auto& c : candidates) {
    if (read_file(c, &tpl)) return tpl;
  }
  err_ = "template not found: " + candidates.front().string();
  return {};
}

bool ReportRenderer::render_job(const JobRecord& job, std::string* out) {
  err_.clear();
  std::string tpl = load_template();
  if (tpl.empty()) return false;
  return render_text(tpl, job, out);
}

bool ReportRenderer::render_text(std::string_view tpl, const JobRecord& job, std::string* out) {
  using kainjow::mustache::data;
  kainjow::mustache::mustache view{std::string(tpl)};
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  data d;
  d.set("title", cfg_.title);
  d.set("job_id", job.job_id);
  d.set("filename", job.filename);
  d.set("status", to_string(job.status));
  d.set("file_size_bytes", std::to_string(job.file_size_bytes));
  d.set("rows_processed", std::to_string(job.rows_processed));
  d.set("malformed_rows", std::to_string(job.malformed_rows));
  d.set("processed_percentage", fixed2(job.processed_percentage));
  if (!job.message.empty()) d.set("message", job.message);
  if (!job.error.empty()) d.set("error", job.error);

  if (job.status == JobStatus::Complete) {
    data done;
    done.set("total_sales", std::to_string(job.total_sales));
    done.set("unique_departments", std::to_string(job.unique_departments));
    done.set("processing_time_seconds", fixed2(job.processing_time_seconds));
    done.set("result_file_name", job.result_file_name);
    done.set("download_url", job.storage_result_file_url ? *job.storage_result_file_url
                                                         : job.result_file_url);
    d.set("complete", done);
  }
  if (!job.finished()) d.set("running", data(data::type::bool_true));

  std::string rendered = view.render(d);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  *out = std::move(rendered);
  return true;
}

}
