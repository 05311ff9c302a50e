#ifndef GENEFLOW_CORE_ERRORS_H_
#define GENEFLOW_CORE_ERRORS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

#define RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

#define ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                          \
  if (!status_or.ok()) return status_or.status();    \
  lhs = std::move(*status_or)

#define CONCAT_IMPL(x, y) x##y
#define CONCAT(x, y) CONCAT_IMPL(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) ASSIGN_OR_RETURN_IMPL(CONCAT(_status_or, __LINE__), lhs, rexpr)

namespace geneflow {

// Error classes surfaced by the core. The kind travels as a status payload so
// callers can tell e.g. a bad sequence from a bad ORF even though both map to
// kInvalidArgument.
enum class ErrorKind {
  kNone,
  kInvalidSequence,
  kInvalidOrf,
  kSessionNotFound,
  kTransientCollaborator,
  kPermanentCollaborator,
  kCancelled,
  kInternal,
};

inline constexpr char kErrorKindPayloadUrl[] = "type.geneflow/error_kind";

std::string ErrorKindName(ErrorKind kind);

absl::Status InvalidSequenceError(absl::string_view message);
absl::Status InvalidOrfError(absl::string_view message);
absl::Status SessionNotFoundError(absl::string_view session_id);
absl::Status TransientCollaboratorError(absl::string_view message);
absl::Status PermanentCollaboratorError(absl::string_view message);
absl::Status RunCancelledError(absl::string_view message);

// Returns the payload kind when present, otherwise infers it from the code.
// ResourceExhausted, Unavailable and DeadlineExceeded are transient;
// Unauthenticated, PermissionDenied, FailedPrecondition and InvalidArgument
// coming from a collaborator are permanent.
ErrorKind GetErrorKind(const absl::Status& status);

bool IsTransient(const absl::Status& status);

}  // namespace geneflow

#endif  // GENEFLOW_CORE_ERRORS_H_
