#include "core/cancellation.h"

#include <algorithm>

#include "absl/time/clock.h"

namespace geneflow {

std::shared_ptr<CancellationRequest> CancellationRequest::WithDeadline(absl::Time deadline) {
  auto request = std::make_shared<CancellationRequest>();
  absl::MutexLock lock(&request->mu_);
  request->deadline_ = deadline;
  return request;
}

std::shared_ptr<CancellationRequest> CancellationRequest::WithTimeout(absl::Duration timeout) {
  return WithDeadline(absl::Now() + timeout);
}

void CancellationRequest::Cancel(const std::string& reason) {
  absl::MutexLock lock(&mu_);
  if (cancelled_) return;
  cancelled_ = true;
  reason_ = reason;
}

bool CancellationRequest::IsCancelled() const {
  absl::ReaderMutexLock lock(&mu_);
  return cancelled_ || absl::Now() >= deadline_;
}

std::string CancellationRequest::Reason() const {
  absl::ReaderMutexLock lock(&mu_);
  if (cancelled_) return reason_;
  if (absl::Now() >= deadline_) return "deadline exceeded";
  return "";
}

bool CancellationRequest::WaitFor(absl::Duration duration) const {
  absl::MutexLock lock(&mu_);
  absl::Time wake = std::min(absl::Now() + duration, deadline_);
  mu_.AwaitWithDeadline(absl::Condition(&cancelled_), wake);
  return cancelled_ || absl::Now() >= deadline_;
}

}  // namespace geneflow
