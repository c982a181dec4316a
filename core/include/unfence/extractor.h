#pragma once

#include "unfence/committer.h"
#include "unfence/document.h"
#include "unfence/path_resolver.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unfence {

enum class FencePolicy {
  // A closing fence clears the active filename.
  Strict,
  // The filename survives a closing fence until prose, a heading or a new
  // filename-bearing fence replaces it.
  Permissive
};

const char* fence_policy_name(FencePolicy policy);
bool parse_fence_policy(std::string_view text, FencePolicy& out);

struct ParseOptions {
  std::filesystem::path base_dir;
  FencePolicy fence_policy = FencePolicy::Permissive;
  bool trace_lines = false;
};

struct PendingFile {
  ResolvedPath path;
  std::string content;
  size_t line = 0;
};

// Pure pass: no filesystem access. Files come out in document order.
std::vector<PendingFile> parse_markdown(const Document& doc, const ParseOptions& opts);

struct ExtractReport {
  size_t lines = 0;
  std::vector<PendingFile> files;
  CommitReport commit;
};

ExtractReport extract_document(const Document& doc, const ParseOptions& opts, IFileSink& sink);
ExtractReport extract_text(std::string_view raw, const ParseOptions& opts, IFileSink& sink);

} // namespace unfence
