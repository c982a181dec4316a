#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unfence {

constexpr std::string_view kReasoningEndMarker = "</think>";

struct Document {
  std::vector<std::string> lines;
};

// Strips a leading UTF-8 BOM and control bytes other than \n, \r and \t.
std::string normalize_text(std::string_view raw);

// Keeps only the text after the first "</think>"; unchanged when absent.
std::string strip_reasoning_preamble(std::string_view text);

// Splits normalized text on '\n'. A trailing '\r' stays on its line so CRLF
// bodies are written back unchanged; the classifier trims it away.
// A final line break does not produce an extra empty line.
Document make_document(std::string_view raw);

bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string& error);
bool load_document(const std::filesystem::path& path,
                   bool strip_reasoning,
                   Document& out,
                   std::string& error);

} // namespace unfence
