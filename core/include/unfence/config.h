#pragma once

#include "unfence/extractor.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace unfence {

struct ExtractConfig {
  std::string input = "response.md";
  std::string log_file = "utility.log";
  // Relative to the root directory; empty means the root itself.
  std::string base_dir;
  FencePolicy fence_policy = FencePolicy::Permissive;
  bool strip_reasoning = true;
  bool trace_lines = false;
};

struct DumpConfig {
  // Relative to the root directory; empty means the root itself.
  std::string source_dir;
  std::string output = "output.txt";
  std::string mode = "exclude";
  std::vector<std::string> patterns;
};

struct ToolConfig {
  std::string work_dir = "ai_builder";
  ExtractConfig extract;
  DumpConfig dump;
};

// Defaults are returned for a missing file or unknown extension; parse
// errors are logged and also fall back to defaults.
ToolConfig load_tool_config(const std::filesystem::path& path);

// First of unfence.yaml, unfence.yml, unfence.json, base_config.json under root.
std::optional<std::filesystem::path> find_config_file(const std::filesystem::path& root);

bool is_valid_dump_mode(const std::string& mode);

} // namespace unfence
