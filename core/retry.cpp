#include "core/retry.h"

#include <algorithm>
#include <cmath>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "core/errors.h"

namespace geneflow {

absl::Duration RetryPolicy::BackoffAfter(int attempt) const {
  double factor = std::pow(multiplier, std::max(0, attempt - 1));
  absl::Duration wait = initial_backoff * factor;
  return std::min(wait, max_backoff);
}

absl::Status RetryWithBackoff(const RetryPolicy& policy, const CancellationRequest* cancellation,
                              absl::string_view label, const std::function<absl::Status(int attempt)>& fn,
                              int* attempts) {
  const int max_attempts = std::max(1, policy.max_attempts);
  if (attempts != nullptr) *attempts = 0;

  for (int attempt = 1;; ++attempt) {
    if (cancellation != nullptr && cancellation->IsCancelled()) {
      return RunCancelledError(absl::StrCat(label, ": ", cancellation->Reason()));
    }

    absl::Status status = fn(attempt);
    if (attempts != nullptr) *attempts = attempt;
    if (status.ok()) return status;

    if (!IsTransient(status)) {
      LOG(WARNING) << label << " failed permanently on attempt " << attempt << ": " << status;
      return status;
    }
    if (attempt >= max_attempts) {
      LOG(ERROR) << "Maximum retries reached for " << label << ": " << status;
      return status;
    }

    absl::Duration wait = policy.BackoffAfter(attempt);
    LOG(INFO) << "Retrying " << label << " in " << wait << "... (Attempt " << attempt << "/" << max_attempts
              << "): " << status.message();
    if (cancellation != nullptr) {
      if (cancellation->WaitFor(wait)) {
        return RunCancelledError(absl::StrCat(label, ": ", cancellation->Reason()));
      }
    } else {
      absl::SleepFor(wait);
    }
  }
}

}  // namespace geneflow
