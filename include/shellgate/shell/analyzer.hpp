#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/shell/command_extractor.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace shellgate::shell {

struct AnalyzerOptions {
  ExtractorOptions extractor = default_extractor_options();
  std::size_t max_depth = 32;
};

struct Analysis {
  std::vector<Segment> segments;
  // Every command of the input: top level first, then the contents of each
  // substitution and `sh -c` script, depth-first.
  std::vector<CommandInvocation> commands;
  std::size_t max_depth_seen = 0;
};

/// Enumerates every command `command` would run, including those nested in
/// substitutions at any depth. Parse failures and nesting beyond
/// `max_depth` are reported as failures.
[[nodiscard]] common::Result<Analysis> analyze(const std::string &command,
                                               const AnalyzerOptions &options = {});

} // namespace shellgate::shell
