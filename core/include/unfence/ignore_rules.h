#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unfence {

struct IgnoreRule {
  std::string pattern;
  // Directory holding the .gitignore, relative to the dump root.
  std::filesystem::path base;
  bool negate = false;
  bool dir_only = false;
  bool anchored = false;
};

std::vector<IgnoreRule> parse_ignore_text(const std::string& text, const std::filesystem::path& base);

// Empty when `dir` has no readable .gitignore.
std::vector<IgnoreRule> load_gitignore(const std::filesystem::path& dir, const std::filesystem::path& base);

// '*' and '?' never match '/'.
bool glob_match(std::string_view pattern, std::string_view text);

bool rule_matches(const IgnoreRule& rule, const std::filesystem::path& rel_path, bool is_dir);

// First matching rule decides; a matching '!' rule keeps the path.
bool is_ignored(const std::vector<IgnoreRule>& rules, const std::filesystem::path& rel_path, bool is_dir);

// Equal to the basename, or a substring of the basename or of the relative path.
bool matches_name_pattern(const std::string& pattern, const std::filesystem::path& rel_path);

// mode "include": keep only matches. mode "exclude": drop matches.
bool passes_patterns(const std::vector<std::string>& patterns,
                     const std::string& mode,
                     const std::filesystem::path& rel_path);

} // namespace unfence
