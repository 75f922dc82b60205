#include "shellgate/shell/analyzer.hpp"

#include "shellgate/shell/substitution.hpp"

#include <algorithm>

namespace shellgate::shell {

namespace {

class Analyzer {
public:
  explicit Analyzer(const AnalyzerOptions &options) : options_(options) {}

  common::Status visit(const std::string &text, std::size_t depth) {
    if (depth > options_.max_depth) {
      return common::Status::error("command nesting exceeds " +
                                   std::to_string(options_.max_depth) + " levels");
    }
    analysis_.max_depth_seen = std::max(analysis_.max_depth_seen, depth);

    auto tokens = tokenize(text);
    if (!tokens.ok()) {
      return common::Status::error(tokens.error());
    }
    const Segment script{.text = text, .offset = 0, .tokens = std::move(tokens.value())};
    auto extraction = extract_commands(script, options_.extractor, depth);
    if (!extraction.ok()) {
      return common::Status::error(extraction.error());
    }
    for (auto &command : extraction.value().commands) {
      analysis_.commands.push_back(std::move(command));
    }
    for (const auto &inline_script : extraction.value().inline_scripts) {
      if (auto status = visit(inline_script, depth + 1); !status.ok()) {
        return status;
      }
    }
    return visit_substitutions(text, depth);
  }

  common::Status visit_substitutions(const std::string &text, std::size_t depth) {
    auto substitutions = find_substitutions(text);
    if (!substitutions.ok()) {
      return common::Status::error(substitutions.error());
    }
    for (const auto &substitution : substitutions.value()) {
      common::Status status = common::Status::success();
      if (substitution.kind == SubstitutionKind::Arithmetic) {
        if (depth + 1 > options_.max_depth) {
          return common::Status::error("command nesting exceeds " +
                                       std::to_string(options_.max_depth) + " levels");
        }
        status = visit_substitutions(substitution.body, depth + 1);
      } else {
        status = visit(substitution.body, depth + 1);
      }
      if (!status.ok()) {
        return status;
      }
    }
    return common::Status::success();
  }

  Analysis take() { return std::move(analysis_); }

private:
  const AnalyzerOptions &options_;
  Analysis analysis_;
};

} // namespace

common::Result<Analysis> analyze(const std::string &command, const AnalyzerOptions &options) {
  auto segments = split_segments(command);
  if (!segments.ok()) {
    return common::Result<Analysis>::failure(segments.error());
  }

  Analyzer analyzer(options);
  if (auto status = analyzer.visit(command, 0); !status.ok()) {
    return common::Result<Analysis>::failure(status.error());
  }
  Analysis analysis = analyzer.take();
  analysis.segments = std::move(segments.value());
  return common::Result<Analysis>::success(std::move(analysis));
}

} // namespace shellgate::shell
