#ifndef GENEFLOW_CORE_RETRY_H_
#define GENEFLOW_CORE_RETRY_H_

#include <functional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include "core/cancellation.h"

namespace geneflow {

struct RetryPolicy {
  int max_attempts = 3;
  absl::Duration initial_backoff = absl::Seconds(1);
  double multiplier = 2.0;
  absl::Duration max_backoff = absl::Seconds(30);

  // Wait after the `attempt`-th failure (1-based), capped at max_backoff.
  absl::Duration BackoffAfter(int attempt) const;
};

// Calls `fn` until it succeeds, fails with a non-transient error, exhausts
// policy.max_attempts or the request is cancelled. `fn` receives the 1-based
// attempt number. The number of calls made is stored in `attempts` when it is
// non-null. Backoff waits wake early on cancellation.
absl::Status RetryWithBackoff(const RetryPolicy& policy, const CancellationRequest* cancellation,
                              absl::string_view label, const std::function<absl::Status(int attempt)>& fn,
                              int* attempts = nullptr);

}  // namespace geneflow

#endif  // GENEFLOW_CORE_RETRY_H_
