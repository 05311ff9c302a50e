#include "core/request_dispatcher.h"

#include <algorithm>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include <nlohmann/json.hpp>

#include "core/errors.h"

namespace geneflow {

RequestDispatcher::RequestDispatcher(RouteFunc route_func, int num_threads)
    : route_func_(std::move(route_func)), num_threads_(std::max(1, num_threads)) {
  for (int i = 0; i < num_threads_; ++i) {
    workers_.emplace_back(&RequestDispatcher::WorkerLoop, this);
  }
}

RequestDispatcher::RequestDispatcher(RequestRouter* router, int num_threads)
    : RequestDispatcher(
          [router](const Request& request, std::shared_ptr<CancellationRequest> cancellation) {
            RouteOptions options;
            options.compare_to = request.compare_to;
            options.cancel = std::move(cancellation);
            return router->Route(request.message, request.session_id, request.owner_id, options);
          },
          num_threads) {}

RequestDispatcher::~RequestDispatcher() {
  {
    absl::MutexLock lock(&mu_);
    stop_ = true;
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::vector<absl::StatusOr<RoutedResult>> RequestDispatcher::Dispatch(
    const std::vector<Request>& requests, std::shared_ptr<CancellationRequest> cancellation) {
  if (requests.empty()) return {};

  struct SharedState {
    absl::Mutex mu;
    size_t remaining ABSL_GUARDED_BY(mu) = 0;
    std::vector<absl::StatusOr<RoutedResult>> results ABSL_GUARDED_BY(mu);
  };
  auto state = std::make_shared<SharedState>();
  {
    absl::MutexLock lock(&state->mu);
    state->remaining = requests.size();
    state->results.assign(requests.size(), absl::UnknownError("not dispatched"));
  }

  for (size_t i = 0; i < requests.size(); ++i) {
    const Request& request = requests[i];
    auto task = [this, i, request, state, cancellation]() {
      absl::StatusOr<RoutedResult> result;
      if (cancellation && cancellation->IsCancelled()) {
        result = RunCancelledError(cancellation->Reason());
      } else {
        result = route_func_(request, cancellation);
      }

      absl::MutexLock lock(&state->mu);
      state->results[i] = std::move(result);
      state->remaining--;
    };

    absl::MutexLock lock(&mu_);
    tasks_.push(std::move(task));
  }
  VLOG(1) << "Dispatched " << requests.size() << " requests to " << num_threads_ << " workers";

  absl::MutexLock lock(&state->mu);
  auto all_done = [state]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(state->mu) { return state->remaining == 0; };
  state->mu.Await(absl::Condition(&all_done));
  return std::move(state->results);
}

void RequestDispatcher::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      absl::MutexLock lock(&mu_);
      auto condition = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return stop_ || !tasks_.empty(); };
      mu_.Await(absl::Condition(&condition));

      if (stop_ && tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

namespace {

// Reads an optional string field into `out`; absent or null keeps `out`.
absl::Status ReadOptionalString(const nlohmann::json& j, const char* key, int line_number, std::string* out) {
  if (!j.contains(key) || j[key].is_null()) return absl::OkStatus();
  if (!j[key].is_string()) {
    return absl::InvalidArgumentError(absl::StrCat("batch line ", line_number, ": '", key, "' must be a string"));
  }
  *out = j[key].get<std::string>();
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::vector<RequestDispatcher::Request>> ParseBatchRequests(absl::string_view content,
                                                                          const std::string& default_session,
                                                                          const std::string& default_owner) {
  std::vector<RequestDispatcher::Request> requests;
  int line_number = 0;
  for (absl::string_view raw : absl::StrSplit(content, '\n')) {
    ++line_number;
    absl::string_view line = absl::StripAsciiWhitespace(raw);
    if (line.empty()) continue;
    RequestDispatcher::Request request{std::string(line), default_session, default_owner, std::nullopt};
    if (line.front() == '{') {
      nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        return absl::InvalidArgumentError(absl::StrCat("batch line ", line_number, ": malformed JSON"));
      }
      if (!j.contains("message") || !j["message"].is_string()) {
        return absl::InvalidArgumentError(absl::StrCat("batch line ", line_number, ": 'message' must be a string"));
      }
      request.message = j["message"].get<std::string>();
      RETURN_IF_ERROR(ReadOptionalString(j, "session_id", line_number, &request.session_id));
      RETURN_IF_ERROR(ReadOptionalString(j, "owner_id", line_number, &request.owner_id));
      std::string compare_to;
      RETURN_IF_ERROR(ReadOptionalString(j, "compare_to", line_number, &compare_to));
      if (!compare_to.empty()) request.compare_to = std::move(compare_to);
    }
    requests.push_back(std::move(request));
  }
  return requests;
}

}  // namespace geneflow
