#ifndef GENEFLOW_CORE_SESSION_STORE_H_
#define GENEFLOW_CORE_SESSION_STORE_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

#include "core/database.h"
#include "core/session.h"

namespace geneflow {

struct SessionStoreOptions {
  absl::Duration max_session_age = absl::Hours(24);
  // Time source; absl::Now when empty.
  std::function<absl::Time()> clock;
};

struct SessionStats {
  int total_sessions = 0;
  int active_today = 0;
  int total_messages = 0;
  double avg_messages_per_session = 0.0;
};

void to_json(nlohmann::json& j, const SessionStats& stats);

// Process-wide owner of session state and the only writer of message history
// and context. Every mutation is applied to a copy, persisted, and only then
// committed to memory, so a failed write leaves the session untouched.
// Updates to one session are serialized by a per-session mutex that is held
// only for the duration of a single read or write.
class SessionStore {
 public:
  // Loads all active sessions from `db`, which must outlive the store.
  static absl::StatusOr<std::unique_ptr<SessionStore>> Create(Database* db, SessionStoreOptions options = {});

  absl::StatusOr<Session> CreateSession(const std::string& owner_id = kAnonymousOwner);

  // Refreshes last-access and persists. NotFound for unknown or deleted ids.
  absl::StatusOr<Session> Get(const std::string& session_id);

  // Empty or unknown ids create a new session with a fresh id.
  absl::StatusOr<Session> GetOrCreate(const std::string& session_id, const std::string& owner_id = kAnonymousOwner);

  absl::Status AppendMessage(const std::string& session_id, Role role, const std::string& content,
                             const nlohmann::json& metadata = nlohmann::json::object());

  absl::Status SetContext(const std::string& session_id, const std::string& key, const nlohmann::json& value);

  // With an empty key returns the whole context object.
  absl::StatusOr<nlohmann::json> GetContext(const std::string& session_id, const std::string& key = "");

  // Last `n` messages in order, without refreshing last-access.
  absl::StatusOr<std::vector<Message>> RecentMessages(const std::string& session_id, int n);

  // Soft delete: the row stays on disk with active = 0.
  absl::Status Delete(const std::string& session_id);

  // Physically removes a session, active or not.
  absl::Status Purge(const std::string& session_id);

  // Hard-removes active sessions idle for longer than `max_age` and returns
  // their ids. Sessions that disappear concurrently are skipped.
  std::vector<std::string> SweepExpired(absl::Duration max_age);
  std::vector<std::string> SweepExpired() { return SweepExpired(options_.max_session_age); }

  SessionStats Stats();

 private:
  struct Entry {
    absl::Mutex mu;
    Session session ABSL_GUARDED_BY(mu);
    bool removed ABSL_GUARDED_BY(mu) = false;
  };

  SessionStore(Database* db, SessionStoreOptions options) : db_(db), options_(std::move(options)) {}

  absl::Status LoadActive();
  absl::Time Now() const;
  std::shared_ptr<Entry> Find(const std::string& session_id);
  std::vector<std::shared_ptr<Entry>> SnapshotEntries();
  void Forget(const std::string& session_id, const std::shared_ptr<Entry>& entry);
  absl::Status Persist(const Session& session);

  // Runs `fn` on a copy of the session, bumps last-access, persists and
  // commits. Returns the committed session.
  absl::StatusOr<Session> Mutate(const std::string& session_id, const std::function<absl::Status(Session&)>& fn);

  Database* db_;
  SessionStoreOptions options_;

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::shared_ptr<Entry>> sessions_ ABSL_GUARDED_BY(mu_);
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_SESSION_STORE_H_
