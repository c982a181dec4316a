#pragma once

#include "unfence/config.h"

#include <filesystem>
#include <optional>

namespace unfence {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path work_dir;
  std::filesystem::path input;
  std::filesystem::path log_file;
  std::filesystem::path extract_base;
  std::filesystem::path dump_source;
  std::filesystem::path dump_output;
};

// --root override, then UNFENCE_ROOT, then ROOT_DIRECTORY, then the current directory.
std::filesystem::path resolve_root(const std::optional<std::filesystem::path>& root_override);

ResolvedPaths resolve_paths(const std::filesystem::path& root, const ToolConfig& cfg);

} // namespace unfence
