#include "unfence/file_sink.h"

#include "unfence/path_resolver.h"

#include <chrono>
#include <fstream>
#include <system_error>

namespace unfence {

namespace fs = std::filesystem;

namespace {
bool under_any(const std::set<fs::path>& prefixes, const fs::path& path) {
  for (const auto& prefix : prefixes) {
    if (is_within(prefix, path)) {
      return true;
    }
  }
  return false;
}

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path tmp = target;
  tmp += ".unfence-tmp-" + std::to_string(stamp);
  return tmp;
}
} // namespace

bool DiskFileSink::ensure_directory(const fs::path& dir, std::string& error) {
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    return true;
  }
  fs::create_directories(dir, ec);
  if (ec) {
    error = "create_directories failed: " + dir.string() + ": " + ec.message();
    return false;
  }
  if (!fs::is_directory(dir, ec)) {
    error = "not a directory: " + dir.string();
    return false;
  }
  return true;
}

bool DiskFileSink::write_file(const fs::path& path, const std::string& contents, std::string& error) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    error = "target is a directory: " + path.string();
    return false;
  }

  const fs::path tmp = temp_sibling(path);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "open failed: " + tmp.string();
      return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      error = "write failed: " + path.string();
      return false;
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    error = "rename failed: " + path.string() + ": " + ec.message();
    std::error_code cleanup_ec;
    fs::remove(tmp, cleanup_ec);
    return false;
  }
  return true;
}

bool MemoryFileSink::ensure_directory(const fs::path& dir, std::string& error) {
  if (under_any(failing_dirs_, dir)) {
    error = "create_directories failed: " + dir.string() + ": injected failure";
    return false;
  }
  directories_.insert(dir.lexically_normal());
  return true;
}

bool MemoryFileSink::write_file(const fs::path& path, const std::string& contents, std::string& error) {
  if (under_any(failing_writes_, path)) {
    error = "write failed: " + path.string() + ": injected failure";
    return false;
  }
  files_[path.lexically_normal()] = contents;
  ++write_count_;
  return true;
}

void MemoryFileSink::fail_directories_under(const fs::path& prefix) {
  failing_dirs_.insert(prefix);
}

void MemoryFileSink::fail_writes_under(const fs::path& prefix) {
  failing_writes_.insert(prefix);
}

bool MemoryFileSink::has_file(const fs::path& path) const {
  return files_.count(path.lexically_normal()) > 0;
}

std::string MemoryFileSink::read(const fs::path& path) const {
  auto it = files_.find(path.lexically_normal());
  if (it == files_.end()) return {};
  return it->second;
}

} // namespace unfence
