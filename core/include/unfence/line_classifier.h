#pragma once

#include <string>
#include <string_view>

namespace unfence {

struct LineToken {
  enum class Kind { FenceOpen, FenceClose, Heading, Plain };
  Kind kind = Kind::Plain;
  // FenceOpen: info string (may be empty). Heading: path text. Plain: the raw line.
  std::string text;
};

std::string trim(std::string_view s);

// Three or more backticks, then nothing or a single non-whitespace token.
bool match_fence(std::string_view line, std::string& info);

// "###" then optional whitespace and a non-empty remainder not starting with '#'.
// Optional surrounding backticks are removed from the captured path.
bool match_heading(std::string_view line, std::string& path);

// Filename heuristic shared by info strings and lookahead lines.
bool looks_like_file_name(std::string_view text);

// Headings are only recognized outside a block; inside, they are body text.
LineToken classify_line(const std::string& line, bool inside_block);

const char* kind_name(LineToken::Kind kind);

} // namespace unfence
