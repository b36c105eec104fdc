#pragma once
#include "csv_stream/storage_backend.hpp"
#include <filesystem>

namespace cs {

// Files under a results root. Logical paths that would leave the root are refused.
class LocalStorage final : public StorageBackend {
public:
  explicit LocalStorage(std::filesystem::path base_path);

  std::optional<std::string> save(const std::string& path,
                                  std::string_view content,
                                  std::string* err) override;
  bool exists(const std::string& path) override;
  std::string url_for(const std::string& path) override;
  const char* kind() const noexcept override { return "local"; }

  const std::filesystem::path& base_path() const noexcept { return base_; }

private:
  std::filesystem::path base_;
};

}
