#include "unfencectl/cli_api.h"

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return kExitFatal;
  }

  std::string command = argv[1];

  if (command == "extract") {
    ExtractCommandOptions opts;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--root" && i + 1 < argc) {
        opts.root = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config = fs::path(argv[++i]);
      } else if (arg == "--in" && i + 1 < argc) {
        opts.input = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        opts.out_dir = fs::path(argv[++i]);
      } else if (arg == "--report" && i + 1 < argc) {
        opts.report = fs::path(argv[++i]);
      } else if (arg == "--strict") {
        opts.fence_policy = unfence::FencePolicy::Strict;
      } else if (arg == "--permissive") {
        opts.fence_policy = unfence::FencePolicy::Permissive;
      } else if (arg == "--keep-reasoning") {
        opts.keep_reasoning = true;
      } else if (arg == "--dry-run") {
        opts.dry_run = true;
      } else if (arg == "--trace") {
        opts.trace = true;
      } else if (arg == "--quiet") {
        opts.quiet = true;
      } else {
        print_usage();
        return kExitFatal;
      }
    }
    return extract_command(opts);
  }

  if (command == "dump") {
    DumpCommandOptions opts;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--root" && i + 1 < argc) {
        opts.root = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        opts.config = fs::path(argv[++i]);
      } else if (arg == "--src" && i + 1 < argc) {
        opts.source = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        opts.output = fs::path(argv[++i]);
      } else if (arg == "--mode" && i + 1 < argc) {
        opts.mode = std::string(argv[++i]);
      } else if (arg == "--pattern" && i + 1 < argc) {
        opts.patterns.push_back(argv[++i]);
      } else if (arg == "--quiet") {
        opts.quiet = true;
      } else {
        print_usage();
        return kExitFatal;
      }
    }
    return dump_command(opts);
  }

  print_usage();
  return kExitFatal;
}
