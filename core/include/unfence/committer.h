#pragma once

#include "unfence/file_sink.h"
#include "unfence/path_resolver.h"

#include <filesystem>
#include <string>
#include <vector>

namespace unfence {

struct PendingFile;

struct CommitFailure {
  std::filesystem::path path;
  std::string stage;  // "mkdir" or "write"
  std::string message;
};

struct CommitReport {
  std::vector<std::filesystem::path> written;
  std::vector<CommitFailure> failed;

  bool ok() const { return failed.empty(); }
};

bool commit_file(IFileSink& sink, const PendingFile& file, CommitReport& report);

// A failing file never stops the ones after it.
CommitReport commit_files(IFileSink& sink, const std::vector<PendingFile>& files);

} // namespace unfence
