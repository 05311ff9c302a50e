#ifndef GENEFLOW_CORE_SESSION_H_
#define GENEFLOW_CORE_SESSION_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

namespace geneflow {

inline constexpr char kAnonymousOwner[] = "anonymous";

enum class Role { kUser, kAssistant, kSystem };

std::string RoleName(Role role);
absl::StatusOr<Role> ParseRole(absl::string_view name);

struct Message {
  Role role = Role::kUser;
  std::string content;
  absl::Time timestamp;
  nlohmann::json metadata = nlohmann::json::object();

  bool operator==(const Message& other) const {
    return role == other.role && content == other.content && timestamp == other.timestamp &&
           metadata == other.metadata;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }
};

// Conversation state for one user session. Timestamps are kept at
// microsecond precision so a snapshot round-trips exactly.
struct Session {
  std::string id;
  std::string owner_id = kAnonymousOwner;
  absl::Time created_at;
  absl::Time last_accessed;
  std::vector<Message> messages;
  nlohmann::json context = nlohmann::json::object();
  bool active = true;

  nlohmann::json ToSnapshot() const;
  static absl::StatusOr<Session> FromSnapshot(const nlohmann::json& snapshot);
};

// Truncates `t` to whole microseconds.
absl::Time TruncateToMicros(absl::Time t);

// Random RFC 4122 version 4 identifier.
std::string NewSessionId();

}  // namespace geneflow

#endif  // GENEFLOW_CORE_SESSION_H_
