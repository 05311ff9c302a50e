#include "core/errors.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace geneflow {

namespace {

absl::Status WithKind(absl::Status status, ErrorKind kind) {
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

ErrorKind KindFromName(absl::string_view name) {
  for (ErrorKind kind : {ErrorKind::kInvalidSequence, ErrorKind::kInvalidOrf, ErrorKind::kSessionNotFound,
                         ErrorKind::kTransientCollaborator, ErrorKind::kPermanentCollaborator, ErrorKind::kCancelled,
                         ErrorKind::kInternal}) {
    if (ErrorKindName(kind) == name) return kind;
  }
  return ErrorKind::kInternal;
}

}  // namespace

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kInvalidSequence:
      return "invalid_sequence";
    case ErrorKind::kInvalidOrf:
      return "invalid_orf";
    case ErrorKind::kSessionNotFound:
      return "session_not_found";
    case ErrorKind::kTransientCollaborator:
      return "transient_collaborator";
    case ErrorKind::kPermanentCollaborator:
      return "permanent_collaborator";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

absl::Status InvalidSequenceError(absl::string_view message) {
  return WithKind(absl::InvalidArgumentError(message), ErrorKind::kInvalidSequence);
}

absl::Status InvalidOrfError(absl::string_view message) {
  return WithKind(absl::InvalidArgumentError(message), ErrorKind::kInvalidOrf);
}

absl::Status SessionNotFoundError(absl::string_view session_id) {
  return WithKind(absl::NotFoundError(absl::StrCat("Session not found: ", session_id)), ErrorKind::kSessionNotFound);
}

absl::Status TransientCollaboratorError(absl::string_view message) {
  return WithKind(absl::UnavailableError(message), ErrorKind::kTransientCollaborator);
}

absl::Status PermanentCollaboratorError(absl::string_view message) {
  return WithKind(absl::FailedPreconditionError(message), ErrorKind::kPermanentCollaborator);
}

absl::Status RunCancelledError(absl::string_view message) {
  return WithKind(absl::CancelledError(message), ErrorKind::kCancelled);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) return ErrorKind::kNone;
  auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (payload.has_value()) return KindFromName(std::string(*payload));

  switch (status.code()) {
    case absl::StatusCode::kResourceExhausted:
    case absl::StatusCode::kUnavailable:
    case absl::StatusCode::kDeadlineExceeded:
      return ErrorKind::kTransientCollaborator;
    case absl::StatusCode::kUnauthenticated:
    case absl::StatusCode::kPermissionDenied:
    case absl::StatusCode::kFailedPrecondition:
    case absl::StatusCode::kInvalidArgument:
      return ErrorKind::kPermanentCollaborator;
    case absl::StatusCode::kNotFound:
      return ErrorKind::kSessionNotFound;
    case absl::StatusCode::kCancelled:
      return ErrorKind::kCancelled;
    default:
      return ErrorKind::kInternal;
  }
}

bool IsTransient(const absl::Status& status) { return GetErrorKind(status) == ErrorKind::kTransientCollaborator; }

}  // namespace geneflow
