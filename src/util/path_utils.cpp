#include "csv_stream/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace cs {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

std::optional<std::filesystem::path> confine_under(const std::filesystem::path& root,
                                                   std::string_view rel) {
  const std::filesystem::path relp{std::string(rel)};
  if (rel.empty() || relp.is_absolute() || relp.has_root_name()) return std::nullopt;

  std::error_code ec;
  auto base_canon = std::filesystem::weakly_canonical(root, ec);
  if (ec) return std::nullopt;
  auto target_canon = std::filesystem::weakly_canonical(base_canon / relp, ec);
  if (ec) return std::nullopt;

  // target must keep every component of base as a prefix
  auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(),
                                target_canon.begin(), target_canon.end());
  if (mismatch.first != base_canon.end()) return std::nullopt;
  if (target_canon == base_canon) return std::nullopt;
  return target_canon;
}

bool ends_with_ci(std::string_view s, std::string_view suffix) {
  if (s.size() < suffix.size()) return false;
  return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(),
                    [](char a, char b){
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

static bool fail(std::string* why, const char* msg) {
  if (why) *why = msg;
  return false;
}

bool is_safe_result_filename(std::string_view name, std::string* why) {
  bool blank = std::all_of(name.begin(), name.end(),
                           [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
  if (name.empty() || blank) return fail(why, "Filename cannot be empty.");

  for (std::string_view bad : {"..", "/", "\\", "~"}) {
    if (name.find(bad) != std::string_view::npos) return fail(why, "Invalid filename.");
  }
  if (!ends_with_ci(name, ".csv")) return fail(why, "Only CSV files are available for download.");

  for (char c : name) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    if (!ok) return fail(why, "Invalid filename format.");
  }
  return true;
}

std::string safe_stem(std::string_view filename) {
  std::string base = std::filesystem::path(std::string(filename)).filename().string();
  auto dot = base.rfind('.');
  if (dot != std::string::npos) base.resize(dot);

  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') out.push_back(c);
  }
  return out.empty() ? std::string("results") : out;
}

}
