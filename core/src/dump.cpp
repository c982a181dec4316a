#include "unfence/dump.h"

#include "unfence/document.h"
#include "unfence/ignore_rules.h"
#include "unfence/line_classifier.h"
#include "unfence/log.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace unfence {

namespace fs = std::filesystem;

namespace {
constexpr char kFallbackInfo[] = "text";

bool has_fence_line(const std::string& content) {
  std::istringstream in(content);
  std::string line;
  std::string info;
  while (std::getline(in, line)) {
    if (match_fence(line, info)) return true;
  }
  return false;
}

struct Walker {
  const DumpOptions& opts;
  fs::path root;
  std::vector<fs::path> skip;
  DumpResult& out;

  bool is_skipped(const fs::path& path) const {
    const auto normal = path.lexically_normal();
    return std::find(skip.begin(), skip.end(), normal) != skip.end();
  }

  void emit_file(const fs::path& abs, const fs::path& rel) {
    const std::string rel_text = rel.generic_string();
    std::string content;
    std::string error;
    if (!read_file_bytes(abs, content, error)) {
      log::error("Skipped unreadable file: " + rel_text + " - Error: " + error);
      out.skipped.push_back(rel_text);
      return;
    }
    if (content.find('\0') != std::string::npos) {
      log::warn("Skipped binary file: " + rel_text);
      out.skipped.push_back(rel_text);
      return;
    }
    if (has_fence_line(content)) {
      log::warn("file contains a fence line, extraction will cut it short: " + rel_text);
    }
    out.text += format_dump_entry(rel_text, content);
    out.files.push_back(rel_text);
  }

  void walk(const fs::path& dir, const fs::path& rel_dir, std::vector<IgnoreRule> rules) {
    const auto local = load_gitignore(dir, rel_dir);
    rules.insert(rules.end(), local.begin(), local.end());

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
      entries.push_back(*it);
    }
    if (ec) {
      log::error("directory listing failed: " + dir.string() + ": " + ec.message());
      return;
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
      return a.path().filename() < b.path().filename();
    });

    for (const auto& entry : entries) {
      const fs::path rel = rel_dir / entry.path().filename();
      std::error_code type_ec;
      if (entry.is_symlink(type_ec)) {
        if (entry.is_directory(type_ec)) {
          log::warn("Skipped symlinked directory: " + rel.generic_string());
          continue;
        }
      } else if (entry.is_directory(type_ec)) {
        if (entry.path().filename() == ".git") continue;
        if (is_ignored(rules, rel, true)) continue;
        walk(entry.path(), rel, rules);
        continue;
      }
      if (!entry.is_regular_file(type_ec)) continue;
      if (is_skipped(entry.path())) continue;
      if (is_ignored(rules, rel, false)) continue;
      if (!passes_patterns(opts.patterns, opts.mode, rel)) continue;
      emit_file(entry.path(), rel);
    }
  }
};

std::string info_for(const std::string& rel_path) {
  const bool has_space = std::any_of(rel_path.begin(), rel_path.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
  return has_space ? std::string(kFallbackInfo) : rel_path;
}

fs::path normalized_absolute(const fs::path& p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  return (ec ? p : abs).lexically_normal();
}
} // namespace

std::string format_dump_entry(const std::string& rel_path, const std::string& content) {
  std::string entry = "\n### " + rel_path + "\n```" + info_for(rel_path) + "\n" + content;
  if (!content.empty() && content.back() != '\n') {
    entry += '\n';
  }
  entry += "```\n";
  return entry;
}

bool dump_directory(const DumpOptions& opts, DumpResult& out, std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(opts.source_dir, ec)) {
    error = "source directory not found: " + opts.source_dir.string();
    return false;
  }

  out = {};
  Walker walker{opts, normalized_absolute(opts.source_dir), {}, out};
  for (const auto& p : opts.skip_paths) {
    walker.skip.push_back(normalized_absolute(p));
  }
  walker.walk(walker.root, fs::path(), {});
  log::info("dumped " + std::to_string(out.files.size()) + " files from " + walker.root.string() + " (" +
            std::to_string(out.skipped.size()) + " skipped)");
  return true;
}

} // namespace unfence
