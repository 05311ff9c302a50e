#include "core/session_store.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/time/clock.h"

#include "core/errors.h"

namespace geneflow {

void to_json(nlohmann::json& j, const SessionStats& stats) {
  j = nlohmann::json{{"total_sessions", stats.total_sessions},
                     {"active_today", stats.active_today},
                     {"total_messages", stats.total_messages},
                     {"avg_messages_per_session", stats.avg_messages_per_session}};
}

absl::StatusOr<std::unique_ptr<SessionStore>> SessionStore::Create(Database* db, SessionStoreOptions options) {
  if (db == nullptr) return absl::InvalidArgumentError("SessionStore requires a database");
  std::unique_ptr<SessionStore> store(new SessionStore(db, std::move(options)));
  RETURN_IF_ERROR(store->LoadActive());
  return store;
}

absl::Status SessionStore::LoadActive() {
  ASSIGN_OR_RETURN(auto rows, db_->GetActiveSessions());
  absl::MutexLock lock(&mu_);
  for (const auto& row : rows) {
    auto j = nlohmann::json::parse(row.snapshot, nullptr, false);
    if (j.is_discarded()) {
      LOG(WARNING) << "Skipping session " << row.id << ": snapshot is not valid JSON";
      continue;
    }
    auto session_or = Session::FromSnapshot(j);
    if (!session_or.ok()) {
      LOG(WARNING) << "Skipping session " << row.id << ": " << session_or.status();
      continue;
    }
    auto entry = std::make_shared<Entry>();
    entry->session = std::move(*session_or);
    sessions_[row.id] = std::move(entry);
  }
  LOG(INFO) << "Loaded " << sessions_.size() << " active sessions";
  return absl::OkStatus();
}

absl::Time SessionStore::Now() const { return TruncateToMicros(options_.clock ? options_.clock() : absl::Now()); }

std::shared_ptr<SessionStore::Entry> SessionStore::Find(const std::string& session_id) {
  absl::MutexLock lock(&mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<SessionStore::Entry>> SessionStore::SnapshotEntries() {
  absl::MutexLock lock(&mu_);
  std::vector<std::shared_ptr<Entry>> entries;
  entries.reserve(sessions_.size());
  for (const auto& [id, entry] : sessions_) {
    entries.push_back(entry);
  }
  return entries;
}

void SessionStore::Forget(const std::string& session_id, const std::shared_ptr<Entry>& entry) {
  absl::MutexLock lock(&mu_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end() && it->second == entry) sessions_.erase(it);
}

absl::Status SessionStore::Persist(const Session& session) {
  Database::SessionRow row;
  row.id = session.id;
  row.owner_id = session.owner_id;
  row.snapshot = session.ToSnapshot().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  row.last_accessed_micros = absl::ToUnixMicros(session.last_accessed);
  row.active = session.active;
  return db_->UpsertSession(row);
}

absl::StatusOr<Session> SessionStore::Mutate(const std::string& session_id,
                                             const std::function<absl::Status(Session&)>& fn) {
  auto entry = Find(session_id);
  if (!entry) return SessionNotFoundError(session_id);

  absl::MutexLock lock(&entry->mu);
  if (entry->removed) return SessionNotFoundError(session_id);

  Session updated = entry->session;
  RETURN_IF_ERROR(fn(updated));
  updated.last_accessed = std::max(Now(), updated.last_accessed);
  RETURN_IF_ERROR(Persist(updated));
  entry->session = updated;
  return updated;
}

absl::StatusOr<Session> SessionStore::CreateSession(const std::string& owner_id) {
  Session session;
  session.id = NewSessionId();
  session.owner_id = owner_id.empty() ? kAnonymousOwner : owner_id;
  session.created_at = Now();
  session.last_accessed = session.created_at;
  RETURN_IF_ERROR(Persist(session));

  auto entry = std::make_shared<Entry>();
  {
    absl::MutexLock entry_lock(&entry->mu);
    entry->session = session;
  }
  absl::MutexLock lock(&mu_);
  sessions_[session.id] = std::move(entry);
  VLOG(1) << "Created session " << session.id << " for " << session.owner_id;
  return session;
}

absl::StatusOr<Session> SessionStore::Get(const std::string& session_id) {
  return Mutate(session_id, [](Session&) { return absl::OkStatus(); });
}

absl::StatusOr<Session> SessionStore::GetOrCreate(const std::string& session_id, const std::string& owner_id) {
  if (!session_id.empty()) {
    auto session_or = Get(session_id);
    if (session_or.ok() || GetErrorKind(session_or.status()) != ErrorKind::kSessionNotFound) {
      return session_or;
    }
    LOG(INFO) << "Session " << session_id << " not found; starting a new one";
  }
  return CreateSession(owner_id);
}

absl::Status SessionStore::AppendMessage(const std::string& session_id, Role role, const std::string& content,
                                         const nlohmann::json& metadata) {
  return Mutate(session_id,
                [&](Session& s) {
                  Message m;
                  m.role = role;
                  m.content = content;
                  // Stamped under the session lock so timestamps follow message order.
                  m.timestamp = Now();
                  if (metadata.is_object()) m.metadata = metadata;
                  s.messages.push_back(std::move(m));
                  return absl::OkStatus();
                })
      .status();
}

absl::Status SessionStore::SetContext(const std::string& session_id, const std::string& key,
                                      const nlohmann::json& value) {
  if (key.empty()) return absl::InvalidArgumentError("Context key must not be empty");
  return Mutate(session_id,
                [&](Session& s) {
                  s.context[key] = value;
                  return absl::OkStatus();
                })
      .status();
}

absl::StatusOr<nlohmann::json> SessionStore::GetContext(const std::string& session_id, const std::string& key) {
  ASSIGN_OR_RETURN(Session session, Get(session_id));
  if (key.empty()) return session.context;
  auto it = session.context.find(key);
  if (it == session.context.end()) {
    return absl::NotFoundError("Context key not found: " + key);
  }
  return *it;
}

absl::StatusOr<std::vector<Message>> SessionStore::RecentMessages(const std::string& session_id, int n) {
  auto entry = Find(session_id);
  if (!entry) return SessionNotFoundError(session_id);

  absl::MutexLock lock(&entry->mu);
  if (entry->removed) return SessionNotFoundError(session_id);
  const auto& messages = entry->session.messages;
  size_t count = std::min(messages.size(), static_cast<size_t>(std::max(0, n)));
  return std::vector<Message>(messages.end() - count, messages.end());
}

absl::Status SessionStore::Delete(const std::string& session_id) {
  auto entry = Find(session_id);
  if (!entry) return SessionNotFoundError(session_id);
  {
    absl::MutexLock lock(&entry->mu);
    if (entry->removed) return SessionNotFoundError(session_id);
    Session updated = entry->session;
    updated.active = false;
    updated.last_accessed = std::max(Now(), updated.last_accessed);
    RETURN_IF_ERROR(Persist(updated));
    entry->session = std::move(updated);
    entry->removed = true;
  }
  Forget(session_id, entry);
  LOG(INFO) << "Deactivated session " << session_id;
  return absl::OkStatus();
}

absl::Status SessionStore::Purge(const std::string& session_id) {
  auto entry = Find(session_id);
  if (entry) {
    absl::MutexLock lock(&entry->mu);
    RETURN_IF_ERROR(db_->DeleteSession(session_id));
    entry->removed = true;
  } else {
    RETURN_IF_ERROR(db_->DeleteSession(session_id));
  }
  if (entry) Forget(session_id, entry);
  LOG(INFO) << "Purged session " << session_id;
  return absl::OkStatus();
}

std::vector<std::string> SessionStore::SweepExpired(absl::Duration max_age) {
  const absl::Time now = Now();
  std::vector<std::string> removed;
  for (const auto& entry : SnapshotEntries()) {
    std::string id;
    {
      absl::MutexLock lock(&entry->mu);
      if (entry->removed) continue;
      if (now - entry->session.last_accessed <= max_age) continue;
      id = entry->session.id;
      absl::Status status = db_->DeleteSession(id);
      if (!status.ok()) {
        LOG(WARNING) << "Failed to remove expired session " << id << ": " << status;
        continue;
      }
      entry->removed = true;
    }
    Forget(id, entry);
    removed.push_back(std::move(id));
  }
  if (!removed.empty()) LOG(INFO) << "Swept " << removed.size() << " expired sessions";
  return removed;
}

SessionStats SessionStore::Stats() {
  const absl::Time now = Now();
  SessionStats stats;
  for (const auto& entry : SnapshotEntries()) {
    absl::MutexLock lock(&entry->mu);
    if (entry->removed) continue;
    ++stats.total_sessions;
    if (now - entry->session.last_accessed <= absl::Hours(24)) ++stats.active_today;
    stats.total_messages += static_cast<int>(entry->session.messages.size());
  }
  if (stats.total_sessions > 0) {
    stats.avg_messages_per_session = static_cast<double>(stats.total_messages) / stats.total_sessions;
  }
  return stats;
}

}  // namespace geneflow
