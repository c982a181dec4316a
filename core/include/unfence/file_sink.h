#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace unfence {

class IFileSink {
 public:
  virtual ~IFileSink() = default;
  virtual bool ensure_directory(const std::filesystem::path& dir, std::string& error) = 0;
  // Replaces the whole file or leaves it untouched.
  virtual bool write_file(const std::filesystem::path& path,
                          const std::string& contents,
                          std::string& error) = 0;
};

// Writes through a temporary sibling that is renamed over the target.
class DiskFileSink final : public IFileSink {
 public:
  bool ensure_directory(const std::filesystem::path& dir, std::string& error) override;
  bool write_file(const std::filesystem::path& path,
                  const std::string& contents,
                  std::string& error) override;
};

class MemoryFileSink final : public IFileSink {
 public:
  bool ensure_directory(const std::filesystem::path& dir, std::string& error) override;
  bool write_file(const std::filesystem::path& path,
                  const std::string& contents,
                  std::string& error) override;

  // Failure injection: any directory or file at or below `prefix` fails.
  void fail_directories_under(const std::filesystem::path& prefix);
  void fail_writes_under(const std::filesystem::path& prefix);

  bool has_file(const std::filesystem::path& path) const;
  std::string read(const std::filesystem::path& path) const;
  const std::map<std::filesystem::path, std::string>& files() const { return files_; }
  const std::set<std::filesystem::path>& directories() const { return directories_; }
  size_t write_count() const { return write_count_; }

 private:
  std::map<std::filesystem::path, std::string> files_;
  std::set<std::filesystem::path> directories_;
  std::set<std::filesystem::path> failing_dirs_;
  std::set<std::filesystem::path> failing_writes_;
  size_t write_count_ = 0;
};

} // namespace unfence
