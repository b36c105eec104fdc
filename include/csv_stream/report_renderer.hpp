#pragma once
#include "csv_stream/job_store.hpp"
#include <string>
#include <string_view>

namespace cs {

// Renders the HTML job report (templates/job_report.mustache) for GET /jobs/{id}/report.
class ReportRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string template_name = "job_report.mustache";
    std::string title = "CSV Sales Processor";
  };

  ReportRenderer();
  explicit ReportRenderer(Config cfg);

  bool render_job(const JobRecord& job, std::string* out);

  // Renders an arbitrary template text; used for the built-in fallback page too.
  bool render_text(std::string_view tpl, const JobRecord& job, std::string* out);

  const std::string& error() const { return err_; }

private:
  std::string load_template();

  Config cfg_;
  std::string err_;
};

}
