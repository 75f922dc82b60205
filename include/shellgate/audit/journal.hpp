#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/security/decision.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace shellgate::audit {

struct JournalEntry {
  std::int64_t id = 0;
  std::string created_at;
  std::string session_id;
  std::string tool;
  std::string command;
  std::string project_dir;
  bool allowed = true;
  std::string kind;
  std::string stage;
  std::string reason;
  std::string policy_fingerprint;
};

struct JournalStats {
  std::uint64_t total = 0;
  std::uint64_t blocked = 0;
};

/// Append-only SQLite record of hook decisions. Written by the host process
/// after a decision is made; the evaluator never touches it.
class DecisionJournal {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<DecisionJournal>>
  open(const std::filesystem::path &db_path);

  ~DecisionJournal();
  DecisionJournal(const DecisionJournal &) = delete;
  DecisionJournal &operator=(const DecisionJournal &) = delete;

  [[nodiscard]] common::Result<std::int64_t> record(const std::string &tool,
                                                    const std::string &command,
                                                    const std::string &project_dir,
                                                    const security::Decision &decision,
                                                    const std::string &policy_fingerprint);

  /// Newest first.
  [[nodiscard]] common::Result<std::vector<JournalEntry>> recent(std::size_t limit) const;
  [[nodiscard]] common::Result<JournalStats> stats() const;

  [[nodiscard]] const std::string &session_id() const { return session_id_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  DecisionJournal(std::filesystem::path db_path, sqlite3 *db, std::string session_id);

  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string session_id_;
  mutable std::mutex mutex_;
};

} // namespace shellgate::audit
