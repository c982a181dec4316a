#include "unfence/path_resolver.h"

#include <algorithm>
#include <cctype>

namespace unfence {

namespace {
constexpr std::string_view kIllegalChars = "<>:\"/\\|?*";

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_control(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u < 0x20 || u == 0x7F;
}

bool is_separator(char c) {
  return c == '/' || c == '\\';
}

std::string_view trim_view(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

bool is_wrapper(char c) {
  return c == '`' || c == '"';
}

bool only_dots(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c == '.'; });
}
} // namespace

std::string strip_wrapping(std::string_view raw) {
  std::string_view s = trim_view(raw);
  if (!s.empty() && is_wrapper(s.front())) s.remove_prefix(1);
  if (!s.empty() && is_wrapper(s.back())) s.remove_suffix(1);
  return std::string(s);
}

std::vector<std::string> split_path_components(std::string_view path) {
  std::vector<std::string> parts;
  std::string current;
  bool pending = false;
  for (char c : path) {
    if (is_separator(c)) {
      if (pending) {
        parts.push_back(current);
        current.clear();
        pending = false;
      }
      continue;
    }
    current += c;
    pending = true;
  }
  if (pending) {
    parts.push_back(current);
  }
  return parts;
}

std::string sanitize_component(std::string_view component) {
  std::string out;
  out.reserve(component.size());
  for (char c : component) {
    if (is_control(c)) continue;
    if (kIllegalChars.find(c) != std::string_view::npos) {
      out += '_';
    } else {
      out += c;
    }
  }

  // Leftovers of "### `path`" style captures.
  std::string_view view = trim_view(out);
  while (!view.empty() && (view.front() == '#' || view.front() == '`' || is_space(view.front()))) {
    view.remove_prefix(1);
  }
  while (!view.empty() && (view.back() == '`' || is_space(view.back()))) view.remove_suffix(1);
  view = trim_view(view);

  std::string result(view);
  if (result.empty() || only_dots(result)) {
    return kPlaceholderComponent;
  }
  return result;
}

ResolvedPath resolve_file_path(std::string_view raw, const std::filesystem::path& base_dir) {
  const std::string trimmed = strip_wrapping(raw);
  const auto parts = split_path_components(trimmed);

  ResolvedPath out;
  out.directory = base_dir;
  if (parts.empty()) {
    out.file_name = kPlaceholderComponent;
    return out;
  }
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    out.directory /= sanitize_component(parts[i]);
  }
  out.file_name = sanitize_component(parts.back());
  return out;
}

bool is_within(const std::filesystem::path& base_dir, const std::filesystem::path& candidate) {
  const auto base = base_dir.lexically_normal();
  const auto target = candidate.lexically_normal();
  const auto rel = target.lexically_relative(base);
  if (rel.empty()) return false;
  for (const auto& part : rel) {
    if (part == "..") return false;
  }
  return true;
}

} // namespace unfence
