#include "unfence/config.h"

#include "unfence/log.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>

namespace unfence {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::string work_dir;
  std::string input;
  std::string log_file;
  std::optional<std::string> base_dir;
  std::string fence_policy;
  std::optional<bool> strip_reasoning;
  std::optional<bool> trace_lines;
  std::optional<std::string> source_dir;
  std::string output;
  std::string mode;
  std::optional<std::vector<std::string>> patterns;
};

void apply_fields(ToolConfig& cfg, const ConfigFields& f) {
  if (!f.work_dir.empty()) cfg.work_dir = f.work_dir;
  if (!f.input.empty()) cfg.extract.input = f.input;
  if (!f.log_file.empty()) cfg.extract.log_file = f.log_file;
  if (f.base_dir.has_value()) cfg.extract.base_dir = f.base_dir.value();
  if (!f.fence_policy.empty()) {
    if (!parse_fence_policy(f.fence_policy, cfg.extract.fence_policy)) {
      log::warn("unknown fence_policy '" + f.fence_policy + "'; keeping " +
                fence_policy_name(cfg.extract.fence_policy));
    }
  }
  if (f.strip_reasoning.has_value()) cfg.extract.strip_reasoning = f.strip_reasoning.value();
  if (f.trace_lines.has_value()) cfg.extract.trace_lines = f.trace_lines.value();
  if (f.source_dir.has_value()) cfg.dump.source_dir = f.source_dir.value();
  if (!f.output.empty()) cfg.dump.output = f.output;
  if (!f.mode.empty()) {
    if (is_valid_dump_mode(f.mode)) {
      cfg.dump.mode = f.mode;
    } else {
      log::warn("unknown dump mode '" + f.mode + "'; keeping " + cfg.dump.mode);
    }
  }
  if (f.patterns.has_value()) cfg.dump.patterns = f.patterns.value();
}

void read_dump_json(const nlohmann::json& node, ConfigFields& f) {
  if (node.contains("source_dir")) f.source_dir = node["source_dir"].get<std::string>();
  if (node.contains("output")) f.output = node["output"].get<std::string>();
  if (node.contains("mode")) f.mode = node["mode"].get<std::string>();
  if (node.contains("patterns") && node["patterns"].is_array()) {
    std::vector<std::string> patterns;
    for (const auto& v : node["patterns"]) {
      patterns.push_back(v.get<std::string>());
    }
    f.patterns = patterns;
  }
}

void read_dump_yaml(const YAML::Node& node, ConfigFields& f) {
  if (node["source_dir"]) f.source_dir = node["source_dir"].as<std::string>();
  if (node["output"]) f.output = node["output"].as<std::string>();
  if (node["mode"]) f.mode = node["mode"].as<std::string>();
  if (node["patterns"]) {
    std::vector<std::string> patterns;
    for (const auto& v : node["patterns"]) {
      patterns.push_back(v.as<std::string>());
    }
    f.patterns = patterns;
  }
}

ConfigFields read_json_fields(const std::filesystem::path& path) {
  std::ifstream in(path);
  nlohmann::json j;
  in >> j;
  const auto& root = j.contains("unfence") ? j["unfence"] : j;

  ConfigFields f;
  if (root.contains("work_dir")) f.work_dir = root["work_dir"].get<std::string>();
  if (root.contains("extract") && root["extract"].is_object()) {
    const auto& ex = root["extract"];
    if (ex.contains("input")) f.input = ex["input"].get<std::string>();
    if (ex.contains("log_file")) f.log_file = ex["log_file"].get<std::string>();
    if (ex.contains("base_dir")) f.base_dir = ex["base_dir"].get<std::string>();
    if (ex.contains("fence_policy")) f.fence_policy = ex["fence_policy"].get<std::string>();
    if (ex.contains("strip_reasoning")) f.strip_reasoning = ex["strip_reasoning"].get<bool>();
    if (ex.contains("trace_lines")) f.trace_lines = ex["trace_lines"].get<bool>();
  }
  // base_config.json keeps mode/patterns at the top level.
  read_dump_json(root, f);
  if (root.contains("dump") && root["dump"].is_object()) {
    read_dump_json(root["dump"], f);
  }
  return f;
}

ConfigFields read_yaml_fields(const std::filesystem::path& path) {
  YAML::Node doc = YAML::LoadFile(path.string());
  YAML::Node root = doc["unfence"] ? doc["unfence"] : doc;

  ConfigFields f;
  if (root["work_dir"]) f.work_dir = root["work_dir"].as<std::string>();
  if (root["extract"]) {
    const auto ex = root["extract"];
    if (ex["input"]) f.input = ex["input"].as<std::string>();
    if (ex["log_file"]) f.log_file = ex["log_file"].as<std::string>();
    if (ex["base_dir"]) f.base_dir = ex["base_dir"].as<std::string>();
    if (ex["fence_policy"]) f.fence_policy = ex["fence_policy"].as<std::string>();
    if (ex["strip_reasoning"]) f.strip_reasoning = ex["strip_reasoning"].as<bool>();
    if (ex["trace_lines"]) f.trace_lines = ex["trace_lines"].as<bool>();
  }
  read_dump_yaml(root, f);
  if (root["dump"]) {
    read_dump_yaml(root["dump"], f);
  }
  return f;
}
} // namespace

bool is_valid_dump_mode(const std::string& mode) {
  return mode == "include" || mode == "exclude";
}

ToolConfig load_tool_config(const std::filesystem::path& path) {
  ToolConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      apply_fields(cfg, read_json_fields(path));
    } catch (const std::exception& e) {
      log::warn(std::string("JSON config parse failed, using defaults: ") + e.what());
      return ToolConfig{};
    }
    log::info("config loaded: " + path.string());
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      apply_fields(cfg, read_yaml_fields(path));
    } catch (const std::exception& e) {
      log::warn(std::string("YAML config parse failed, using defaults: ") + e.what());
      return ToolConfig{};
    }
    log::info("config loaded: " + path.string());
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

std::optional<std::filesystem::path> find_config_file(const std::filesystem::path& root) {
  static const char* kCandidates[] = {"unfence.yaml", "unfence.yml", "unfence.json", "base_config.json"};
  for (const char* name : kCandidates) {
    const auto candidate = root / name;
    if (file_exists(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace unfence
