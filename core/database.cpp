#include "core/database.h"

#include "absl/log/log.h"

#include "core/errors.h"

#include <sqlite3.h>
namespace geneflow {

absl::Status Database::Statement::Prepare() {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    LOG(ERROR) << "Prepare error: " << err << " (SQL: " << sql_ << ")";
    return absl::InternalError("Prepare error: " + err + " (SQL: " + sql_ + ")");
  }
  stmt_.reset(raw_stmt);
  return absl::OkStatus();
}

absl::Status Database::Statement::BindInt(int index, int value) {
  if (sqlite3_bind_int(stmt_.get(), index, value) != SQLITE_OK) {
    return absl::InternalError("BindInt error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindInt64(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_.get(), index, value) != SQLITE_OK) {
    return absl::InternalError("BindInt64 error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindText(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    return absl::InternalError("BindText error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_.get(), index) != SQLITE_OK) {
    return absl::InternalError("BindNull error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> Database::Statement::Step() {
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  std::string err = sqlite3_errmsg(db_);
  LOG(ERROR) << "Step error: " << err << " (SQL: " << sql_ << ")";
  return absl::InternalError("Step error: " + err + " (SQL: " + sql_ + ")");
}

absl::Status Database::Statement::Run() {
  auto res = Step();
  if (!res.ok()) return res.status();
  return absl::OkStatus();
}

int Database::Statement::ColumnInt(int index) { return sqlite3_column_int(stmt_.get(), index); }

int64_t Database::Statement::ColumnInt64(int index) { return sqlite3_column_int64(stmt_.get(), index); }

std::string Database::Statement::ColumnText(int index) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), index));
  return text ? std::string(text) : "";
}

absl::StatusOr<std::unique_ptr<Database::Statement>> Database::Prepare(const std::string& sql) {
  absl::MutexLock lock(&mu_);
  if (!db_) return absl::FailedPreconditionError("Database is not initialized");
  auto stmt = std::make_unique<Statement>(db_.get(), sql);
  auto status = stmt->Prepare();
  if (!status.ok()) return status;
  return stmt;
}

absl::Status Database::Init(const std::string& db_path) {
  LOG(INFO) << "Initializing database at " << db_path;
  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(raw_db);
    sqlite3_close(raw_db);
    LOG(ERROR) << "Failed to open database: " << err;
    return absl::InternalError("Failed to open database: " + err);
  }

  // Other processes may hold the write lock briefly.
  sqlite3_busy_timeout(raw_db, 5000);

  const char* schema = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        id TEXT PRIMARY KEY,
        owner_id TEXT NOT NULL DEFAULT 'anonymous',
        snapshot TEXT NOT NULL,
        last_accessed INTEGER NOT NULL,
        active INTEGER NOT NULL DEFAULT 1
    );

    CREATE TABLE IF NOT EXISTS executions (
        id TEXT PRIMARY KEY,
        stage TEXT NOT NULL,
        record TEXT NOT NULL,
        start_time INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS executions_by_start ON executions (start_time);

    CREATE TABLE IF NOT EXISTS metric_exports (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        path TEXT,
        payload TEXT NOT NULL,
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP
    );
  )";

  rc = sqlite3_exec(raw_db, schema, nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(raw_db);
    sqlite3_close(raw_db);
    return absl::InternalError("Schema error: " + err);
  }

  absl::MutexLock lock(&mu_);
  db_.reset(raw_db);
  return absl::OkStatus();
}

absl::Status Database::Execute(const std::string& sql) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(sql));
  return stmt->Run();
}

absl::Status Database::UpsertSession(const SessionRow& row) {
  return Execute(
      "INSERT INTO sessions (id, owner_id, snapshot, last_accessed, active) VALUES (?, ?, ?, ?, ?) "
      "ON CONFLICT(id) DO UPDATE SET owner_id = excluded.owner_id, snapshot = excluded.snapshot, "
      "last_accessed = excluded.last_accessed, active = excluded.active "
      "WHERE excluded.last_accessed >= sessions.last_accessed",
      row.id, row.owner_id, row.snapshot, row.last_accessed_micros, row.active ? 1 : 0);
}

absl::StatusOr<Database::SessionRow> Database::GetSession(const std::string& session_id) {
  ASSIGN_OR_RETURN(auto stmt,
                   Prepare("SELECT id, owner_id, snapshot, last_accessed, active FROM sessions WHERE id = ?"));
  RETURN_IF_ERROR(stmt->BindText(1, session_id));

  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row) return absl::NotFoundError("Session row not found: " + session_id);

  SessionRow row;
  row.id = stmt->ColumnText(0);
  row.owner_id = stmt->ColumnText(1);
  row.snapshot = stmt->ColumnText(2);
  row.last_accessed_micros = stmt->ColumnInt64(3);
  row.active = stmt->ColumnInt(4) != 0;
  return row;
}

absl::StatusOr<std::vector<Database::SessionRow>> Database::GetActiveSessions() {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT id, owner_id, snapshot, last_accessed, active FROM sessions "
                                      "WHERE active = 1 ORDER BY last_accessed ASC"));
  std::vector<SessionRow> rows;
  while (true) {
    auto row_or = stmt->Step();
    if (!row_or.ok()) return row_or.status();
    if (!*row_or) break;

    SessionRow row;
    row.id = stmt->ColumnText(0);
    row.owner_id = stmt->ColumnText(1);
    row.snapshot = stmt->ColumnText(2);
    row.last_accessed_micros = stmt->ColumnInt64(3);
    row.active = true;
    rows.push_back(std::move(row));
  }
  return rows;
}

absl::Status Database::DeleteSession(const std::string& session_id) {
  return Execute("DELETE FROM sessions WHERE id = ?", session_id);
}

absl::Status Database::InsertExecution(const ExecutionRow& row) {
  return Execute("INSERT OR IGNORE INTO executions (id, stage, record, start_time) VALUES (?, ?, ?, ?)", row.id,
                 row.stage, row.record, row.start_micros);
}

absl::StatusOr<std::vector<Database::ExecutionRow>> Database::GetExecutions(int64_t since_micros) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT id, stage, record, start_time FROM executions "
                                      "WHERE start_time >= ? ORDER BY start_time ASC, id ASC"));
  RETURN_IF_ERROR(stmt->BindInt64(1, since_micros));

  std::vector<ExecutionRow> rows;
  while (true) {
    auto row_or = stmt->Step();
    if (!row_or.ok()) return row_or.status();
    if (!*row_or) break;

    ExecutionRow row;
    row.id = stmt->ColumnText(0);
    row.stage = stmt->ColumnText(1);
    row.record = stmt->ColumnText(2);
    row.start_micros = stmt->ColumnInt64(3);
    rows.push_back(std::move(row));
  }
  return rows;
}

absl::Status Database::RecordMetricExport(const std::string& path, const std::string& payload) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("INSERT INTO metric_exports (path, payload) VALUES (?, ?)"));
  if (path.empty()) {
    RETURN_IF_ERROR(stmt->BindNull(1));
  } else {
    RETURN_IF_ERROR(stmt->BindText(1, path));
  }
  RETURN_IF_ERROR(stmt->BindText(2, payload));
  return stmt->Run();
}

absl::StatusOr<std::vector<Database::MetricExport>> Database::GetMetricExports() {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT id, path, payload, created_at FROM metric_exports ORDER BY id ASC"));
  std::vector<MetricExport> exports;
  while (true) {
    auto row_or = stmt->Step();
    if (!row_or.ok()) return row_or.status();
    if (!*row_or) break;
    exports.push_back({stmt->ColumnInt(0), stmt->ColumnText(1), stmt->ColumnText(2), stmt->ColumnText(3)});
  }
  return exports;
}

}  // namespace geneflow
