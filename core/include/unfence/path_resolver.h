#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unfence {

// Replacement for a path component that sanitizes to nothing (or to dots only).
constexpr char kPlaceholderComponent[] = "_";

struct ResolvedPath {
  std::filesystem::path directory;
  std::string file_name;

  std::filesystem::path full_path() const { return directory / file_name; }
};

// Removes one layer of wrapping backticks/quotes after trimming whitespace.
std::string strip_wrapping(std::string_view raw);

// Splits on runs of '/' or '\'. Empty pieces at either end are dropped.
std::vector<std::string> split_path_components(std::string_view path);

// Never returns an empty string, ".", or "..".
std::string sanitize_component(std::string_view component);

// Total: every input yields a path whose directory is base_dir or below it.
ResolvedPath resolve_file_path(std::string_view raw, const std::filesystem::path& base_dir);

// Lexical containment check used by tests and the committer's logging.
bool is_within(const std::filesystem::path& base_dir, const std::filesystem::path& candidate);

} // namespace unfence
