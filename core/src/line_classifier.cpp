#include "unfence/line_classifier.h"

#include <algorithm>
#include <cctype>

namespace unfence {

namespace {
bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

std::string trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return std::string(s);
}

bool match_fence(std::string_view line, std::string& info) {
  const std::string t = trim(line);
  size_t ticks = 0;
  while (ticks < t.size() && t[ticks] == '`') ++ticks;
  if (ticks < 3) return false;

  const std::string rest = trim(std::string_view(t).substr(ticks));
  if (std::any_of(rest.begin(), rest.end(), is_space)) {
    return false;
  }
  info = rest;
  return true;
}

bool match_heading(std::string_view line, std::string& path) {
  const std::string t = trim(line);
  if (t.compare(0, 3, "###") != 0) return false;

  std::string rest = trim(std::string_view(t).substr(3));
  if (rest.empty() || rest.front() == '#') return false;

  if (rest.front() == '`') rest.erase(0, 1);
  if (!rest.empty() && rest.back() == '`') rest.pop_back();
  rest = trim(rest);
  if (rest.empty()) return false;
  path = rest;
  return true;
}

bool looks_like_file_name(std::string_view text) {
  return !text.empty() && text.find('.') != std::string_view::npos;
}

LineToken classify_line(const std::string& line, bool inside_block) {
  LineToken token;
  std::string captured;
  if (match_fence(line, captured)) {
    token.kind = inside_block ? LineToken::Kind::FenceClose : LineToken::Kind::FenceOpen;
    token.text = inside_block ? std::string() : captured;
    return token;
  }
  if (!inside_block && match_heading(line, captured)) {
    token.kind = LineToken::Kind::Heading;
    token.text = captured;
    return token;
  }
  token.kind = LineToken::Kind::Plain;
  token.text = line;
  return token;
}

const char* kind_name(LineToken::Kind kind) {
  switch (kind) {
    case LineToken::Kind::FenceOpen: return "fence-open";
    case LineToken::Kind::FenceClose: return "fence-close";
    case LineToken::Kind::Heading: return "heading";
    case LineToken::Kind::Plain: return "plain";
  }
  return "unknown";
}

} // namespace unfence
