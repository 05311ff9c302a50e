#ifndef GENEFLOW_CORE_REQUEST_DISPATCHER_H_
#define GENEFLOW_CORE_REQUEST_DISPATCHER_H_

#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

#include "core/cancellation.h"
#include "core/request_router.h"

namespace geneflow {

/**
 * @brief Routes batches of requests in parallel on a fixed thread pool.
 *
 * Requests that share a session still run one at a time because the router
 * serializes them; the pool only bounds how many sessions progress at once.
 */
class RequestDispatcher {
 public:
  static constexpr int kDefaultWorkers = 4;

  struct Request {
    std::string message;
    std::string session_id;
    std::string owner_id;
    std::optional<std::string> compare_to;
  };

  using RouteFunc = std::function<absl::StatusOr<RoutedResult>(const Request& request,
                                                               std::shared_ptr<CancellationRequest> cancellation)>;

  /**
   * @param route_func Handles a single request. Must be thread-safe.
   * @param num_threads Number of worker threads.
   */
  explicit RequestDispatcher(RouteFunc route_func, int num_threads = kDefaultWorkers);

  // Dispatches to `router`, which must outlive the dispatcher.
  explicit RequestDispatcher(RequestRouter* router, int num_threads = kDefaultWorkers);

  ~RequestDispatcher();

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;

  /**
   * @brief Routes a batch of requests in parallel.
   * Blocks until every request has completed or been cancelled. Results are
   * in input order; requests not started before cancellation fail with a
   * cancelled error.
   */
  std::vector<absl::StatusOr<RoutedResult>> Dispatch(const std::vector<Request>& requests,
                                                     std::shared_ptr<CancellationRequest> cancellation);

  int num_threads() const { return num_threads_; }

 private:
  void WorkerLoop();

  RouteFunc route_func_;
  int num_threads_;
  std::vector<std::thread> workers_;

  absl::Mutex mu_;
  std::queue<std::function<void()>> tasks_ ABSL_GUARDED_BY(mu_);
  bool stop_ ABSL_GUARDED_BY(mu_) = false;
};

// Parses a batch file: one request per non-blank line, either a JSON object
// {message, session_id?, owner_id?, compare_to?} or a plain message. Missing
// fields take the defaults; fields of the wrong type are InvalidArgument.
absl::StatusOr<std::vector<RequestDispatcher::Request>> ParseBatchRequests(absl::string_view content,
                                                                          const std::string& default_session,
                                                                          const std::string& default_owner);

}  // namespace geneflow

#endif  // GENEFLOW_CORE_REQUEST_DISPATCHER_H_
