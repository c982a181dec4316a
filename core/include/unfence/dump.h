#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace unfence {

struct DumpOptions {
  std::filesystem::path source_dir;
  std::string mode = "exclude";
  std::vector<std::string> patterns;
  // Never dumped (e.g. the dump output itself and the log file).
  std::vector<std::filesystem::path> skip_paths;
};

struct DumpResult {
  std::string text;
  std::vector<std::string> files;
  std::vector<std::string> skipped;
};

// "\n### rel\n```info\n" + content (newline-terminated) + "```\n".
std::string format_dump_entry(const std::string& rel_path, const std::string& content);

bool dump_directory(const DumpOptions& opts, DumpResult& out, std::string& error);

} // namespace unfence
