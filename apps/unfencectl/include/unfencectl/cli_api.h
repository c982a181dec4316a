#pragma once

#include "unfence/extractor.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitPartial = 2;

struct ExtractCommandOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config;
  std::optional<std::filesystem::path> input;
  std::optional<std::filesystem::path> out_dir;
  std::optional<unfence::FencePolicy> fence_policy;
  std::optional<std::filesystem::path> report;
  bool keep_reasoning = false;
  bool dry_run = false;
  bool trace = false;
  bool quiet = false;
};

struct DumpCommandOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config;
  std::optional<std::filesystem::path> source;
  std::optional<std::filesystem::path> output;
  std::optional<std::string> mode;
  std::vector<std::string> patterns;
  bool quiet = false;
};

nlohmann::json build_extract_report(const unfence::ExtractReport& report,
                                    const std::filesystem::path& base_dir,
                                    const std::filesystem::path& input,
                                    bool dry_run);
bool write_extract_report(const std::filesystem::path& path, const nlohmann::json& report, std::string& error);

int extract_command(const ExtractCommandOptions& opts);
int dump_command(const DumpCommandOptions& opts);

void print_usage();
