#include "unfence/paths.h"

#include "unfence/log.h"

#include <cstdlib>

namespace unfence {

namespace {
std::filesystem::path anchor(const std::filesystem::path& root, const std::string& value) {
  if (value.empty()) return root;
  const std::filesystem::path p(value);
  if (p.is_absolute()) return p;
  return root / p;
}

std::filesystem::path absolute_or_same(const std::filesystem::path& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) return p;
  return abs.lexically_normal();
}
} // namespace

std::filesystem::path resolve_root(const std::optional<std::filesystem::path>& root_override) {
  if (root_override.has_value()) {
    return absolute_or_same(root_override.value());
  }
  if (const char* env = std::getenv("UNFENCE_ROOT")) {
    if (*env) return absolute_or_same(env);
  }
  if (const char* env = std::getenv("ROOT_DIRECTORY")) {
    if (*env) return absolute_or_same(env);
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return std::filesystem::path(".");
  }
  return cwd;
}

ResolvedPaths resolve_paths(const std::filesystem::path& root, const ToolConfig& cfg) {
  ResolvedPaths out;
  out.root = root;
  out.work_dir = anchor(root, cfg.work_dir);
  out.input = anchor(out.work_dir, cfg.extract.input);
  out.log_file = anchor(out.work_dir, cfg.extract.log_file);
  out.extract_base = anchor(root, cfg.extract.base_dir);
  out.dump_source = anchor(root, cfg.dump.source_dir);
  out.dump_output = anchor(out.work_dir, cfg.dump.output);

  std::error_code ec;
  if (!std::filesystem::exists(out.root, ec)) {
    log::warn(std::string("root path not found: ") + out.root.string());
  }
  return out;
}

} // namespace unfence
