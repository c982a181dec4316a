#include "unfence/extractor.h"

#include "unfence/line_classifier.h"
#include "unfence/log.h"

#include <optional>
#include <utility>

namespace unfence {

namespace {
struct ParseState {
  bool inside_block = false;
  std::optional<std::string> file_name;
  std::filesystem::path directory;
  std::string content;
  // Set once the active filename has been used by a closed block.
  bool carried = false;
  size_t open_line = 0;
};

void adopt(ParseState& state, const ResolvedPath& resolved) {
  state.file_name = resolved.file_name;
  state.directory = resolved.directory;
  state.carried = false;
}

void clear_file(ParseState& state, const std::filesystem::path& base_dir) {
  state.file_name.reset();
  state.directory = base_dir;
  state.carried = false;
}

void emit(ParseState& state, std::vector<PendingFile>& out) {
  if (!state.file_name.has_value() || state.content.empty()) {
    return;
  }
  PendingFile file;
  file.path.directory = state.directory;
  file.path.file_name = *state.file_name;
  file.content = state.content;
  file.line = state.open_line;
  log::info("block closed: " + file.path.full_path().string() + " (opened at line " +
            std::to_string(file.line) + ")");
  out.push_back(std::move(file));
}

std::string line_label(size_t index) {
  return "line " + std::to_string(index + 1);
}
} // namespace

const char* fence_policy_name(FencePolicy policy) {
  switch (policy) {
    case FencePolicy::Strict: return "strict";
    case FencePolicy::Permissive: return "permissive";
  }
  return "permissive";
}

bool parse_fence_policy(std::string_view text, FencePolicy& out) {
  if (text == "strict") {
    out = FencePolicy::Strict;
    return true;
  }
  if (text == "permissive") {
    out = FencePolicy::Permissive;
    return true;
  }
  return false;
}

std::vector<PendingFile> parse_markdown(const Document& doc, const ParseOptions& opts) {
  std::vector<PendingFile> out;
  ParseState state;
  state.directory = opts.base_dir;

  const auto& lines = doc.lines;
  for (size_t i = 0; i < lines.size(); ++i) {
    const LineToken token = classify_line(lines[i], state.inside_block);
    if (opts.trace_lines) {
      log::info(line_label(i) + " " + kind_name(token.kind) +
                (state.inside_block ? " (inside)" : " (outside)"));
    }

    switch (token.kind) {
      case LineToken::Kind::FenceOpen: {
        state.inside_block = true;
        state.open_line = i + 1;
        state.content.clear();
        if (looks_like_file_name(token.text)) {
          adopt(state, resolve_file_path(token.text, opts.base_dir));
          log::info(line_label(i) + ": fence opened for " + *state.file_name);
        } else if (token.text.empty()) {
          std::string ignored;
          if (i + 1 < lines.size()) {
            const std::string next = trim(lines[i + 1]);
            if (looks_like_file_name(next) && !match_fence(next, ignored)) {
              adopt(state, resolve_file_path(next, opts.base_dir));
              ++i;
              log::info(line_label(i) + ": fence opened, filename from next line: " + *state.file_name);
              break;
            }
          }
          log::info(line_label(i) + ": fence opened" +
                    (state.file_name ? " for " + *state.file_name : std::string(" without filename")));
        } else {
          log::info(line_label(i) + ": fence opened, language tag '" + token.text + "'" +
                    (state.file_name ? " for " + *state.file_name : std::string(" without filename")));
        }
        break;
      }
      case LineToken::Kind::FenceClose: {
        state.inside_block = false;
        emit(state, out);
        state.content.clear();
        if (opts.fence_policy == FencePolicy::Strict) {
          clear_file(state, opts.base_dir);
        } else if (state.file_name.has_value()) {
          state.carried = true;
        }
        if (opts.trace_lines) {
          log::info(line_label(i) + ": fence closed");
        }
        break;
      }
      case LineToken::Kind::Heading: {
        adopt(state, resolve_file_path(token.text, opts.base_dir));
        log::info(line_label(i) + ": heading declares " + (state.directory / *state.file_name).string());
        break;
      }
      case LineToken::Kind::Plain: {
        if (state.inside_block) {
          if (state.file_name.has_value()) {
            state.content += lines[i];
            state.content += '\n';
          }
        } else if (state.carried && !trim(lines[i]).empty()) {
          if (opts.trace_lines) {
            log::info(line_label(i) + ": prose drops carried filename " + *state.file_name);
          }
          clear_file(state, opts.base_dir);
        }
        break;
      }
    }
  }

  if (state.inside_block) {
    log::warn("document ended inside an open fence (opened at line " + std::to_string(state.open_line) + ")");
    emit(state, out);
  }
  return out;
}

ExtractReport extract_document(const Document& doc, const ParseOptions& opts, IFileSink& sink) {
  ExtractReport report;
  report.lines = doc.lines.size();
  report.files = parse_markdown(doc, opts);
  log::info("parsed " + std::to_string(report.lines) + " lines, " + std::to_string(report.files.size()) +
            " files pending (policy " + fence_policy_name(opts.fence_policy) + ")");
  report.commit = commit_files(sink, report.files);
  return report;
}

ExtractReport extract_text(std::string_view raw, const ParseOptions& opts, IFileSink& sink) {
  return extract_document(make_document(raw), opts, sink);
}

} // namespace unfence
