#include "unfence/config.h"
#include "unfence/document.h"
#include "unfence/dump.h"
#include "unfence/extractor.h"
#include "unfence/file_sink.h"
#include "unfence/log.h"
#include "unfence/paths.h"
#include "unfencectl/cli_api.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
fs::path absolute_path(const fs::path& p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  return ec ? p : abs.lexically_normal();
}

unfence::ToolConfig load_config_for(const fs::path& root, const std::optional<fs::path>& explicit_config) {
  if (explicit_config.has_value()) {
    return unfence::load_tool_config(absolute_path(explicit_config.value()));
  }
  if (const auto found = unfence::find_config_file(root)) {
    return unfence::load_tool_config(found.value());
  }
  return unfence::ToolConfig{};
}
} // namespace

json build_extract_report(const unfence::ExtractReport& report,
                          const fs::path& base_dir,
                          const fs::path& input,
                          bool dry_run) {
  json j;
  j["base_dir"] = base_dir.generic_string();
  j["input"] = input.generic_string();
  j["lines"] = report.lines;
  j["dry_run"] = dry_run;
  j["planned"] = json::array();
  for (const auto& file : report.files) {
    json item;
    item["path"] = file.path.full_path().generic_string();
    item["bytes"] = file.content.size();
    item["line"] = file.line;
    j["planned"].push_back(item);
  }
  j["written"] = json::array();
  for (const auto& path : report.commit.written) {
    j["written"].push_back(path.generic_string());
  }
  j["failed"] = json::array();
  for (const auto& failure : report.commit.failed) {
    j["failed"].push_back({{"path", failure.path.generic_string()},
                           {"stage", failure.stage},
                           {"message", failure.message}});
  }
  return j;
}

bool write_extract_report(const fs::path& path, const json& report, std::string& error) {
  unfence::DiskFileSink sink;
  if (path.has_parent_path() && !sink.ensure_directory(path.parent_path(), error)) {
    return false;
  }
  return sink.write_file(path, report.dump(2) + "\n", error);
}

int extract_command(const ExtractCommandOptions& opts) {
  unfence::log::set_console_echo(!opts.quiet);
  const fs::path root = unfence::resolve_root(opts.root);
  const auto cfg = load_config_for(root, opts.config);
  const auto paths = unfence::resolve_paths(root, cfg);

  const fs::path input = opts.input ? absolute_path(*opts.input) : paths.input;
  const fs::path base_dir = opts.out_dir ? absolute_path(*opts.out_dir) : paths.extract_base;

  unfence::log::init("unfencectl", paths.log_file);
  unfence::log::info("extract: input " + input.string() + " -> " + base_dir.string());

  unfence::Document doc;
  std::string error;
  const bool strip_reasoning = cfg.extract.strip_reasoning && !opts.keep_reasoning;
  if (!unfence::load_document(input, strip_reasoning, doc, error)) {
    unfence::log::error(error);
    std::cerr << error << "\n";
    unfence::log::shutdown();
    return kExitFatal;
  }

  unfence::ParseOptions parse_opts;
  parse_opts.base_dir = base_dir;
  parse_opts.fence_policy = opts.fence_policy.value_or(cfg.extract.fence_policy);
  parse_opts.trace_lines = opts.trace || cfg.extract.trace_lines;

  unfence::ExtractReport report;
  if (opts.dry_run) {
    report.lines = doc.lines.size();
    report.files = unfence::parse_markdown(doc, parse_opts);
    for (const auto& file : report.files) {
      std::cout << "would write " << file.path.full_path().string() << " (" << file.content.size()
                << " bytes)\n";
    }
  } else {
    unfence::DiskFileSink sink;
    report = unfence::extract_document(doc, parse_opts, sink);
  }

  if (opts.report.has_value()) {
    const auto report_path = absolute_path(*opts.report);
    if (!write_extract_report(report_path, build_extract_report(report, base_dir, input, opts.dry_run), error)) {
      unfence::log::error("report write failed: " + error);
    } else {
      unfence::log::info("report -> " + report_path.string());
    }
  }

  unfence::log::info("extract done: " + std::to_string(report.commit.written.size()) + " written, " +
                     std::to_string(report.commit.failed.size()) + " failed");
  unfence::log::shutdown();
  return report.commit.ok() ? kExitOk : kExitPartial;
}

int dump_command(const DumpCommandOptions& opts) {
  unfence::log::set_console_echo(!opts.quiet);
  const fs::path root = unfence::resolve_root(opts.root);
  const auto cfg = load_config_for(root, opts.config);
  const auto paths = unfence::resolve_paths(root, cfg);

  unfence::DumpOptions dump_opts;
  dump_opts.source_dir = opts.source ? absolute_path(*opts.source) : paths.dump_source;
  dump_opts.mode = opts.mode.value_or(cfg.dump.mode);
  dump_opts.patterns = opts.patterns.empty() ? cfg.dump.patterns : opts.patterns;
  const fs::path output = opts.output ? absolute_path(*opts.output) : paths.dump_output;
  dump_opts.skip_paths = {output, paths.log_file};

  unfence::log::init("unfencectl", paths.log_file);
  if (!unfence::is_valid_dump_mode(dump_opts.mode)) {
    unfence::log::error("invalid mode: " + dump_opts.mode);
    std::cerr << "invalid mode: " << dump_opts.mode << " (expected include or exclude)\n";
    unfence::log::shutdown();
    return kExitFatal;
  }

  unfence::DumpResult result;
  std::string error;
  if (!unfence::dump_directory(dump_opts, result, error)) {
    unfence::log::error(error);
    std::cerr << error << "\n";
    unfence::log::shutdown();
    return kExitFatal;
  }

  unfence::DiskFileSink sink;
  if ((output.has_parent_path() && !sink.ensure_directory(output.parent_path(), error)) ||
      !sink.write_file(output, result.text, error)) {
    unfence::log::error("dump write failed: " + error);
    std::cerr << error << "\n";
    unfence::log::shutdown();
    return kExitFatal;
  }

  unfence::log::info("dump -> " + output.string() + " (" + std::to_string(result.files.size()) + " files)");
  unfence::log::shutdown();
  return kExitOk;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  unfencectl extract [--root <dir>] [--config <file>] [--in <file>] [--out <dir>]\n"
            << "                     [--strict|--permissive] [--keep-reasoning] [--dry-run]\n"
            << "                     [--report <file.json>] [--trace] [--quiet]\n"
            << "  unfencectl dump [--root <dir>] [--config <file>] [--src <dir>] [--out <file>]\n"
            << "                  [--mode include|exclude] [--pattern <p>]... [--quiet]\n";
}
