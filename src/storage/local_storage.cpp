#include "csv_stream/local_storage.hpp"
#include "csv_stream/log.hpp"
#include "csv_stream/path_utils.hpp"
#include <fstream>
#include <system_error>

namespace cs {

LocalStorage::LocalStorage(std::filesystem::path base_path) : base_(std::move(base_path)) {
  std::error_code ec;
  std::filesystem::create_directories(base_, ec);
  if (ec) log_warn("storage", concat("cannot create ", base_.string(), ": ", ec.message()));
  else log_info("storage", concat("LocalStorage rooted at ", base_.string()));
}

std::optional<std::string> LocalStorage::save(const std::string& path,
                                              std::string_view content,
                                              std::string* err) {
  auto full = confine_under(base_, path);
  if (!full) {
    if (err) *err = "path escapes storage root: " + path;
    return std::nullopt;
  }
  if (!ensure_parent_dirs(*full)) {
    if (err) *err = "cannot create directory for " + full->string();
    return std::nullopt;
  }

  std::filesystem::path tmp = *full;
  tmp += ".part";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (err) *err = "open failed: " + tmp.string();
      return std::nullopt;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      if (err) *err = "write failed: " + tmp.string();
      return std::nullopt;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, *full, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    if (err) *err = "rename failed: " + full->string();
    return std::nullopt;
  }
  log_info("storage", concat("saved file locally: ", full->string()));
  return full->string();
}

bool LocalStorage::exists(const std::string& path) {
  auto full = confine_under(base_, path);
  if (!full) return false;
  std::error_code ec;
  return std::filesystem::is_regular_file(*full, ec);
}

std::string LocalStorage::url_for(const std::string& path) {
  return (base_ / path).string();
}

}
