#include "shellgate/audit/journal.hpp"

#include "shellgate/common/hash.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace shellgate::audit {

namespace {

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

} // namespace

common::Result<std::unique_ptr<DecisionJournal>>
DecisionJournal::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<DecisionJournal>>;

  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return OpenResult::failure("Failed to create journal directory: " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    std::string message = db != nullptr ? sqlite3_errmsg(db) : "sqlite open failed";
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return OpenResult::failure("Failed to open journal " + db_path.string() + ": " + message);
  }
  sqlite3_busy_timeout(db, 2000);

  std::unique_ptr<DecisionJournal> journal(
      new DecisionJournal(db_path, db, common::random_hex(8)));
  if (auto status = journal->init_schema(); !status.ok()) {
    return OpenResult::failure("Failed to initialise journal: " + status.error());
  }
  return OpenResult::success(std::move(journal));
}

DecisionJournal::DecisionJournal(std::filesystem::path db_path, sqlite3 *db,
                                 std::string session_id)
    : db_path_(std::move(db_path)), db_(db), session_id_(std::move(session_id)) {}

DecisionJournal::~DecisionJournal() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status DecisionJournal::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS decisions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at TEXT NOT NULL,
  session_id TEXT NOT NULL,
  tool TEXT NOT NULL,
  command TEXT NOT NULL,
  project_dir TEXT NOT NULL DEFAULT '',
  allowed INTEGER NOT NULL,
  kind TEXT NOT NULL,
  stage TEXT NOT NULL,
  reason TEXT NOT NULL DEFAULT '',
  policy_fingerprint TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_decisions_allowed ON decisions(allowed);");
}

common::Result<std::int64_t> DecisionJournal::record(const std::string &tool,
                                                     const std::string &command,
                                                     const std::string &project_dir,
                                                     const security::Decision &decision,
                                                     const std::string &policy_fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO decisions (created_at, session_id, tool, command, project_dir, "
                    "allowed, kind, stage, reason, policy_fingerprint) "
                    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }

  const std::string now = now_rfc3339();
  sqlite3_bind_text(stmt, 1, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, session_id_.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, tool.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, command.c_str(), static_cast<int>(command.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, project_dir.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 6, decision.allowed ? 1 : 0);
  sqlite3_bind_text(stmt, 7, security::block_kind_name(decision.kind), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 8, security::stage_name(decision.stage), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 9, decision.reason.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 10, policy_fingerprint.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::int64_t>::success(sqlite3_last_insert_rowid(db_));
}

common::Result<std::vector<JournalEntry>> DecisionJournal::recent(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, created_at, session_id, tool, command, project_dir, allowed, "
                    "kind, stage, reason, policy_fingerprint FROM decisions "
                    "ORDER BY id DESC LIMIT ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<JournalEntry>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<JournalEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    entries.push_back(JournalEntry{
        .id = sqlite3_column_int64(stmt, 0),
        .created_at = column_text(stmt, 1),
        .session_id = column_text(stmt, 2),
        .tool = column_text(stmt, 3),
        .command = column_text(stmt, 4),
        .project_dir = column_text(stmt, 5),
        .allowed = sqlite3_column_int(stmt, 6) != 0,
        .kind = column_text(stmt, 7),
        .stage = column_text(stmt, 8),
        .reason = column_text(stmt, 9),
        .policy_fingerprint = column_text(stmt, 10),
    });
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<JournalEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<JournalEntry>>::success(std::move(entries));
}

common::Result<JournalStats> DecisionJournal::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT COUNT(*), COALESCE(SUM(CASE WHEN allowed = 0 THEN 1 ELSE 0 END), "
                         "0) FROM decisions",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<JournalStats>::failure(sqlite3_errmsg(db_));
  }
  JournalStats stats;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    stats.total = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    stats.blocked = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
  }
  sqlite3_finalize(stmt);
  return common::Result<JournalStats>::success(stats);
}

} // namespace shellgate::audit
