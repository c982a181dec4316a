#include "unfence/committer.h"

#include "unfence/extractor.h"
#include "unfence/log.h"

namespace unfence {

bool commit_file(IFileSink& sink, const PendingFile& file, CommitReport& report) {
  const auto target = file.path.full_path();
  std::string error;
  if (!sink.ensure_directory(file.path.directory, error)) {
    log::error("directory creation failed, skipping " + target.string() + ": " + error);
    report.failed.push_back({target, "mkdir", error});
    return false;
  }
  if (!sink.write_file(target, file.content, error)) {
    log::error("file write failed, skipping " + target.string() + ": " + error);
    report.failed.push_back({target, "write", error});
    return false;
  }
  log::info("File created: " + target.string() + " (" + std::to_string(file.content.size()) + " bytes)");
  report.written.push_back(target);
  return true;
}

CommitReport commit_files(IFileSink& sink, const std::vector<PendingFile>& files) {
  CommitReport report;
  for (const auto& file : files) {
    commit_file(sink, file, report);
  }
  if (!report.failed.empty()) {
    log::warn(std::to_string(report.failed.size()) + " of " + std::to_string(files.size()) +
              " files could not be written");
  }
  return report;
}

} // namespace unfence
