#ifndef GENEFLOW_CORE_DATABASE_H_
#define GENEFLOW_CORE_DATABASE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <sqlite3.h>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace geneflow {

// SQLite-backed durable store for session snapshots, execution records and
// metric exports. One connection is shared by all callers; SQLite runs it in
// serialized mode.
class Database {
 public:
  Database() : db_(nullptr) {}
  ~Database() = default;

  // Non-copyable
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  absl::Status Init(const std::string& db_path = ":memory:");
  absl::Status Execute(const std::string& sql);

  template <typename... Args>
  absl::Status Execute(const std::string& sql, Args&&... args) {
    auto stmt_or = Prepare(sql);
    if (!stmt_or.ok()) return stmt_or.status();
    auto bind_status = (*stmt_or)->BindAll(std::forward<Args>(args)...);
    if (!bind_status.ok()) return bind_status;
    return (*stmt_or)->Run();
  }

  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
      if (stmt) sqlite3_finalize(stmt);
    }
  };
  using UniqueStmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

  class Statement {
   public:
    Statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {}

    absl::Status Prepare();
    absl::Status BindInt(int index, int value);
    absl::Status BindInt64(int index, int64_t value);
    absl::Status BindText(int index, const std::string& value);
    absl::Status BindNull(int index);

    // Overloads for easier binding
    absl::Status Bind(int index, int value) { return BindInt(index, value); }
    absl::Status Bind(int index, int64_t value) { return BindInt64(index, value); }
    absl::Status Bind(int index, const std::string& value) { return BindText(index, value); }

    template <typename... Args>
    absl::Status BindAll(Args&&... args) {
      return BindRecursive(1, std::forward<Args>(args)...);
    }

    absl::StatusOr<bool> Step();  // Returns true if a row is available (SQLITE_ROW)
    absl::Status Run();           // For operations that don't return rows (SQLITE_DONE)

    int ColumnInt(int index);
    int64_t ColumnInt64(int index);
    std::string ColumnText(int index);

   private:
    absl::Status BindRecursive(int /*index*/) { return absl::OkStatus(); }

    template <typename T, typename... Rest>
    absl::Status BindRecursive(int index, T&& first, Rest&&... rest) {
      auto status = Bind(index, std::forward<T>(first));
      if (!status.ok()) return status;
      return BindRecursive(index + 1, std::forward<Rest>(rest)...);
    }

    sqlite3* db_;
    std::string sql_;
    UniqueStmt stmt_;
  };

  absl::StatusOr<std::unique_ptr<Statement>> Prepare(const std::string& sql);

  struct SessionRow {
    std::string id;
    std::string owner_id;
    std::string snapshot;
    int64_t last_accessed_micros = 0;
    bool active = true;
  };

  /**
   * @brief Inserts or replaces a session snapshot.
   *
   * Last-writer-wins keyed on the last-access timestamp: an existing row is
   * only replaced when the incoming last_accessed_micros is not older than the
   * stored one, so a stale writer in another process cannot roll a session
   * back.
   */
  absl::Status UpsertSession(const SessionRow& row);
  absl::StatusOr<SessionRow> GetSession(const std::string& session_id);
  absl::StatusOr<std::vector<SessionRow>> GetActiveSessions();
  // Physical removal.
  absl::Status DeleteSession(const std::string& session_id);

  struct ExecutionRow {
    std::string id;
    std::string stage;
    std::string record;
    int64_t start_micros = 0;
  };

  // Insert-once: a second insert for the same id is ignored.
  absl::Status InsertExecution(const ExecutionRow& row);
  // Records whose start is at or after `since_micros`, oldest first.
  absl::StatusOr<std::vector<ExecutionRow>> GetExecutions(int64_t since_micros = 0);

  struct MetricExport {
    int id = 0;
    std::string path;
    std::string payload;
    std::string created_at;
  };

  absl::Status RecordMetricExport(const std::string& path, const std::string& payload);
  absl::StatusOr<std::vector<MetricExport>> GetMetricExports();

 private:
  struct DbDeleter {
    void operator()(sqlite3* db) const {
      if (db) sqlite3_close(db);
    }
  };
  absl::Mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_ ABSL_GUARDED_BY(mu_);
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_DATABASE_H_
