#include "unfence/document.h"

#include "unfence/log.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace unfence {

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool keep_byte(unsigned char c) {
  if (c == '\n' || c == '\r' || c == '\t') return true;
  return c >= 0x20 && c != 0x7F;
}
} // namespace

std::string normalize_text(std::string_view raw) {
  if (raw.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
    raw.remove_prefix(kUtf8Bom.size());
  }
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (keep_byte(static_cast<unsigned char>(c))) {
      out += c;
    }
  }
  return out;
}

std::string strip_reasoning_preamble(std::string_view text) {
  const auto pos = text.find(kReasoningEndMarker);
  if (pos == std::string_view::npos) {
    return std::string(text);
  }
  return std::string(text.substr(pos + kReasoningEndMarker.size()));
}

Document make_document(std::string_view raw) {
  const std::string text = normalize_text(raw);
  Document doc;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    doc.lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return doc;
}

bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "input not found: " + path.string();
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "input unreadable: " + path.string();
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = "input read failed: " + path.string();
    return false;
  }
  out = ss.str();
  return true;
}

bool load_document(const std::filesystem::path& path,
                   bool strip_reasoning,
                   Document& out,
                   std::string& error) {
  std::string raw;
  if (!read_file_bytes(path, raw, error)) {
    return false;
  }
  std::string text = normalize_text(raw);
  if (strip_reasoning && text.find(kReasoningEndMarker) != std::string::npos) {
    log::info("reasoning preamble stripped");
    text = strip_reasoning_preamble(text);
  }
  out = make_document(text);
  log::info("document loaded: " + path.string() + " (" + std::to_string(out.lines.size()) + " lines)");
  return true;
}

} // namespace unfence
