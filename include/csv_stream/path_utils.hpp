#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Resolve `rel` under `root`; nullopt if the result escapes `root` or `rel` is absolute.
std::optional<std::filesystem::path> confine_under(const std::filesystem::path& root,
                                                   std::string_view rel);

// Download-name rules: non-empty, no "..", "/", "\", "~", ends in ".csv"
// (case-insensitive), characters limited to [A-Za-z0-9._-].
bool is_safe_result_filename(std::string_view name, std::string* why = nullptr);

// Basename without extension, reduced to [A-Za-z0-9_-]; "results" if nothing survives.
std::string safe_stem(std::string_view filename);

bool ends_with_ci(std::string_view s, std::string_view suffix);

}
