#include "unfence/ignore_rules.h"

#include "unfence/line_classifier.h"
#include "unfence/log.h"

#include <fstream>
#include <sstream>

namespace unfence {

namespace fs = std::filesystem;

namespace {
std::vector<std::string> components_of(const fs::path& rel) {
  std::vector<std::string> out;
  for (const auto& part : rel) {
    const auto s = part.generic_string();
    if (s.empty() || s == "." || s == "/") continue;
    out.push_back(s);
  }
  return out;
}

std::string join_prefix(const std::vector<std::string>& parts, size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    if (i) out += '/';
    out += parts[i];
  }
  return out;
}

// rel_path relative to the rule's directory; false when outside of it.
bool relative_to_base(const IgnoreRule& rule, const fs::path& rel_path, std::vector<std::string>& out) {
  const auto path_parts = components_of(rel_path);
  const auto base_parts = components_of(rule.base);
  if (base_parts.size() > path_parts.size()) return false;
  for (size_t i = 0; i < base_parts.size(); ++i) {
    if (base_parts[i] != path_parts[i]) return false;
  }
  out.assign(path_parts.begin() + static_cast<std::ptrdiff_t>(base_parts.size()), path_parts.end());
  return !out.empty();
}
} // namespace

std::vector<IgnoreRule> parse_ignore_text(const std::string& text, const fs::path& base) {
  std::vector<IgnoreRule> rules;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::string t = trim(line);
    if (t.empty() || t.front() == '#') continue;

    IgnoreRule rule;
    rule.base = base;
    if (t.front() == '!') {
      rule.negate = true;
      t.erase(0, 1);
    }
    if (!t.empty() && t.back() == '/') {
      rule.dir_only = true;
      while (!t.empty() && t.back() == '/') t.pop_back();
    }
    if (!t.empty() && t.front() == '/') {
      rule.anchored = true;
      while (!t.empty() && t.front() == '/') t.erase(0, 1);
    }
    if (t.empty()) continue;
    if (t.find('/') != std::string::npos) {
      rule.anchored = true;
    }
    rule.pattern = t;
    rules.push_back(rule);
  }
  return rules;
}

std::vector<IgnoreRule> load_gitignore(const fs::path& dir, const fs::path& base) {
  const fs::path path = dir / ".gitignore";
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return {};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log::warn("unreadable .gitignore: " + path.string());
    return {};
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_ignore_text(ss.str(), base);
}

bool glob_match(std::string_view pattern, std::string_view text) {
  size_t p = 0;
  size_t t = 0;
  size_t star_p = std::string_view::npos;
  size_t star_t = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star_p = p++;
      star_t = t;
    } else if (p < pattern.size() && text[t] != '/' && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '/' && text[t] == '/') {
      ++p;
      ++t;
    } else if (star_p != std::string_view::npos && text[star_t] != '/') {
      p = star_p + 1;
      t = ++star_t;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

bool rule_matches(const IgnoreRule& rule, const fs::path& rel_path, bool is_dir) {
  std::vector<std::string> parts;
  if (!relative_to_base(rule, rel_path, parts)) return false;

  // Components a dir-only rule may look at: every directory on the way.
  const size_t last = parts.size();
  const size_t usable = (rule.dir_only && !is_dir) ? last - 1 : last;

  if (rule.anchored) {
    for (size_t count = 1; count <= usable; ++count) {
      if (glob_match(rule.pattern, join_prefix(parts, count))) return true;
    }
    return false;
  }
  for (size_t i = 0; i < usable; ++i) {
    if (glob_match(rule.pattern, parts[i])) return true;
  }
  return false;
}

bool is_ignored(const std::vector<IgnoreRule>& rules, const fs::path& rel_path, bool is_dir) {
  for (const auto& rule : rules) {
    if (rule_matches(rule, rel_path, is_dir)) {
      return !rule.negate;
    }
  }
  return false;
}

bool matches_name_pattern(const std::string& pattern, const fs::path& rel_path) {
  if (pattern.empty()) return false;
  const std::string name = rel_path.filename().generic_string();
  const std::string rel = rel_path.generic_string();
  return name == pattern || name.find(pattern) != std::string::npos || rel.find(pattern) != std::string::npos;
}

bool passes_patterns(const std::vector<std::string>& patterns, const std::string& mode, const fs::path& rel_path) {
  bool matched = false;
  for (const auto& pattern : patterns) {
    if (matches_name_pattern(pattern, rel_path)) {
      matched = true;
      break;
    }
  }
  if (mode == "include") {
    return matched;
  }
  return !matched;
}

} // namespace unfence
