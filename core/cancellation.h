#ifndef GENEFLOW_CORE_CANCELLATION_H_
#define GENEFLOW_CORE_CANCELLATION_H_

#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace geneflow {

// Cancellation token shared between a caller and a pipeline run. A run is
// cancelled either explicitly or once its deadline passes.
class CancellationRequest {
 public:
  CancellationRequest() = default;

  static std::shared_ptr<CancellationRequest> WithDeadline(absl::Time deadline);
  static std::shared_ptr<CancellationRequest> WithTimeout(absl::Duration timeout);

  // Marks the request cancelled. Only the first reason is kept.
  void Cancel(const std::string& reason = "cancelled by caller");

  // True after Cancel() or once the deadline has passed.
  bool IsCancelled() const;

  std::string Reason() const;

  // Blocks for up to `duration`. Returns true if the request was cancelled
  // (explicitly or by deadline) before the duration elapsed.
  bool WaitFor(absl::Duration duration) const;

 private:
  mutable absl::Mutex mu_;
  bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
  std::string reason_ ABSL_GUARDED_BY(mu_);
  absl::Time deadline_ ABSL_GUARDED_BY(mu_) = absl::InfiniteFuture();
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_CANCELLATION_H_
