#include "core/session.h"

#include <cstdint>

#include "absl/base/const_init.h"
#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"

namespace geneflow {

namespace {

bool IsInteger(const nlohmann::json& j, const char* key) { return j.contains(key) && j[key].is_number_integer(); }
bool IsString(const nlohmann::json& j, const char* key) { return j.contains(key) && j[key].is_string(); }

absl::StatusOr<Message> MessageFromJson(const nlohmann::json& j) {
  if (!j.is_object() || !IsString(j, "role") || !IsString(j, "content") || !IsInteger(j, "timestamp")) {
    return absl::InvalidArgumentError("Malformed message in session snapshot");
  }
  auto role_or = ParseRole(j["role"].get<std::string>());
  if (!role_or.ok()) return role_or.status();

  Message m;
  m.role = *role_or;
  m.content = j["content"].get<std::string>();
  m.timestamp = absl::FromUnixMicros(j["timestamp"].get<int64_t>());
  if (j.contains("metadata") && j["metadata"].is_object()) {
    m.metadata = j["metadata"];
  }
  return m;
}

}  // namespace

std::string RoleName(Role role) {
  switch (role) {
    case Role::kUser:
      return "user";
    case Role::kAssistant:
      return "assistant";
    case Role::kSystem:
      return "system";
  }
  return "user";
}

absl::StatusOr<Role> ParseRole(absl::string_view name) {
  if (name == "user") return Role::kUser;
  if (name == "assistant") return Role::kAssistant;
  if (name == "system") return Role::kSystem;
  return absl::InvalidArgumentError(absl::StrCat("Unknown message role: ", name));
}

nlohmann::json Session::ToSnapshot() const {
  nlohmann::json messages_json = nlohmann::json::array();
  for (const auto& m : messages) {
    messages_json.push_back({{"role", RoleName(m.role)},
                             {"content", m.content},
                             {"timestamp", absl::ToUnixMicros(m.timestamp)},
                             {"metadata", m.metadata}});
  }
  return {{"id", id},
          {"owner_id", owner_id},
          {"created_at", absl::ToUnixMicros(created_at)},
          {"last_accessed", absl::ToUnixMicros(last_accessed)},
          {"active", active},
          {"messages", messages_json},
          {"context", context}};
}

absl::StatusOr<Session> Session::FromSnapshot(const nlohmann::json& snapshot) {
  if (!snapshot.is_object() || !IsString(snapshot, "id") || !IsInteger(snapshot, "created_at") ||
      !IsInteger(snapshot, "last_accessed")) {
    return absl::InvalidArgumentError("Malformed session snapshot");
  }

  Session s;
  s.id = snapshot["id"].get<std::string>();
  if (IsString(snapshot, "owner_id")) s.owner_id = snapshot["owner_id"].get<std::string>();
  s.created_at = absl::FromUnixMicros(snapshot["created_at"].get<int64_t>());
  s.last_accessed = absl::FromUnixMicros(snapshot["last_accessed"].get<int64_t>());
  if (snapshot.contains("active") && snapshot["active"].is_boolean()) {
    s.active = snapshot["active"].get<bool>();
  }
  if (snapshot.contains("messages")) {
    if (!snapshot["messages"].is_array()) {
      return absl::InvalidArgumentError("Session snapshot messages must be an array");
    }
    for (const auto& mj : snapshot["messages"]) {
      auto m_or = MessageFromJson(mj);
      if (!m_or.ok()) return m_or.status();
      s.messages.push_back(std::move(*m_or));
    }
  }
  if (snapshot.contains("context") && snapshot["context"].is_object()) {
    s.context = snapshot["context"];
  }
  return s;
}

absl::Time TruncateToMicros(absl::Time t) { return absl::FromUnixMicros(absl::ToUnixMicros(t)); }

std::string NewSessionId() {
  static absl::Mutex mu(absl::kConstInit);
  static absl::BitGen* gen = new absl::BitGen();
  uint64_t hi;
  uint64_t lo;
  {
    absl::MutexLock lock(&mu);
    hi = absl::Uniform<uint64_t>(*gen);
    lo = absl::Uniform<uint64_t>(*gen);
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  return absl::StrFormat("%08x-%04x-%04x-%04x-%012x", hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                         lo & 0xFFFFFFFFFFFFULL);
}

}  // namespace geneflow
