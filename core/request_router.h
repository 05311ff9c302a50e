#ifndef GENEFLOW_CORE_REQUEST_ROUTER_H_
#define GENEFLOW_CORE_REQUEST_ROUTER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include <nlohmann/json.hpp>

#include "core/cancellation.h"
#include "core/collaborators.h"
#include "core/performance_tracker.h"
#include "core/pipeline_orchestrator.h"
#include "core/retry.h"
#include "core/session_store.h"
#include "core/turn_gate.h"

namespace geneflow {

inline constexpr char kStageRouterAnalysis[] = "router_analysis";
inline constexpr char kStageRouterChat[] = "router_chat";

enum class RouteKind { kAnalysis, kChat };

std::string RouteKindName(RouteKind kind);

struct RouteOptions {
  // Target sequence for a pairwise comparison during analysis.
  std::optional<std::string> compare_to;
  std::shared_ptr<CancellationRequest> cancel;
};

struct RoutedResult {
  std::string session_id;
  RouteKind kind = RouteKind::kChat;
  bool success = false;
  // The assistant message appended to the session (failure text included).
  std::string response;
  absl::Status status;
  std::optional<PipelineResult> pipeline;

  nlohmann::json ToJson() const;
};

struct RouterOptions {
  int history_window = 10;
  RetryPolicy retry;
};

/**
 * @brief Binds a message to its session and sends it to the pipeline or to
 * the text-completion collaborator.
 *
 * Requests for one session are handled one at a time in arrival order; the
 * session store is only locked for the individual reads and appends. Both the
 * inbound message and the response are appended before Route() returns.
 */
class RequestRouter {
 public:
  static constexpr size_t kMinSequenceRun = 20;

  // `completion` may be null, in which case conversational requests fail
  // with a permanent collaborator error.
  RequestRouter(SessionStore* sessions, PipelineOrchestrator* pipeline, TextCompletionClient* completion,
                PerformanceTracker* tracker, RouterOptions options = {});

  // Errors are returned only when the session store itself fails.
  // Collaborator and analysis failures are reported in the result.
  absl::StatusOr<RoutedResult> Route(const std::string& message, const std::string& session_id = "",
                                     const std::string& owner_id = "", const RouteOptions& options = {});

  // Longest run of IUPAC nucleotide codes in `message` when it has at least
  // kMinSequenceRun characters.
  static std::optional<std::string> ExtractSequence(absl::string_view message);

  static RouteKind Classify(absl::string_view message) {
    return ExtractSequence(message).has_value() ? RouteKind::kAnalysis : RouteKind::kChat;
  }

  static std::string FormatAnalysisResponse(const PipelineResult& result);

 private:
  struct Outcome {
    bool success = false;
    std::string response;
    absl::Status status;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<PipelineResult> pipeline;
    int input_tokens = 0;
    int output_tokens = 0;
    std::string model = kLocalModel;
  };

  absl::StatusOr<Outcome> HandleAnalysis(const std::string& session_id, const std::string& sequence,
                                         const RouteOptions& options);
  Outcome HandleChat(const std::string& message, const std::vector<Message>& history, const RouteOptions& options);

  SessionStore* sessions_;
  PipelineOrchestrator* pipeline_;
  TextCompletionClient* completion_;
  PerformanceTracker* tracker_;
  RouterOptions options_;
  TurnGate turns_;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_REQUEST_ROUTER_H_
