#include "core/request_router.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"

#include "core/constants.h"
#include "core/errors.h"

namespace geneflow {

namespace {

bool IsNucleotideCode(char c) {
  switch (absl::ascii_toupper(static_cast<unsigned char>(c))) {
    case 'A':
    case 'T':
    case 'C':
    case 'G':
    case 'U':
    case 'R':
    case 'Y':
    case 'K':
    case 'M':
    case 'S':
    case 'W':
    case 'B':
    case 'D':
    case 'H':
    case 'V':
    case 'N':
      return true;
    default:
      return false;
  }
}

nlohmann::json ErrorMetadata(const absl::Status& status, absl::string_view route) {
  return {{"error", true},
          {"route", std::string(route)},
          {"error_kind", ErrorKindName(GetErrorKind(status))},
          {"message", std::string(status.message())}};
}

}  // namespace

std::string RouteKindName(RouteKind kind) {
  switch (kind) {
    case RouteKind::kAnalysis:
      return "analysis";
    case RouteKind::kChat:
      return "chat";
  }
  return "unknown";
}

nlohmann::json RoutedResult::ToJson() const {
  nlohmann::json j = {{"session_id", session_id},
                      {"kind", RouteKindName(kind)},
                      {"success", success},
                      {"response", response}};
  if (!status.ok()) {
    j["error"] = std::string(status.message());
    j["error_kind"] = ErrorKindName(GetErrorKind(status));
  }
  if (pipeline) j["pipeline"] = pipeline->ToJson();
  return j;
}

RequestRouter::RequestRouter(SessionStore* sessions, PipelineOrchestrator* pipeline, TextCompletionClient* completion,
                             PerformanceTracker* tracker, RouterOptions options)
    : sessions_(sessions),
      pipeline_(pipeline),
      completion_(completion),
      tracker_(tracker),
      options_(std::move(options)) {}

std::optional<std::string> RequestRouter::ExtractSequence(absl::string_view message) {
  size_t best_start = 0;
  size_t best_len = 0;
  size_t i = 0;
  while (i < message.size()) {
    if (!IsNucleotideCode(message[i])) {
      ++i;
      continue;
    }
    const size_t start = i;
    while (i < message.size() && IsNucleotideCode(message[i])) ++i;
    if (i - start > best_len) {
      best_start = start;
      best_len = i - start;
    }
  }
  if (best_len < kMinSequenceRun) return std::nullopt;
  return absl::AsciiStrToUpper(message.substr(best_start, best_len));
}

std::string RequestRouter::FormatAnalysisResponse(const PipelineResult& result) {
  if (!result.analysis) return absl::StrCat("Run ", result.run_id, " produced no analysis.");
  const AnalysisResult& analysis = *result.analysis;

  std::string out = absl::StrFormat("Analyzed a %d nt %s sequence (run %s): GC %.1f%%, %d ORF(s), %d motif hit(s).",
                                    analysis.length, SequenceTypeName(analysis.type), result.run_id,
                                    analysis.gc_percent, analysis.orfs.size(), analysis.motifs.size());
  if (result.state() == PipelineState::kSkippedNoOrf) {
    absl::StrAppend(&out, "\nNo open reading frames were found, so prediction and enrichment were skipped.");
  }
  if (result.comparison) {
    absl::StrAppend(&out, absl::StrFormat("\nComparison: %.1f%% identity, %s.",
                                          result.comparison->identity_percent, result.comparison->homology));
  }
  for (const auto& protein : result.proteins) {
    absl::StrAppend(&out, absl::StrFormat("\n- %s: %d aa, %.1f Da, hydropathy %.2f%s", protein.orf_id,
                                          protein.length, protein.molecular_weight, protein.hydrophobicity,
                                          protein.signal_peptide ? ", signal peptide" : ""));
  }
  for (const auto& hypothesis : result.hypotheses) {
    absl::StrAppend(&out, absl::StrFormat("\n* %s (confidence %.2f)", hypothesis.statement, hypothesis.confidence));
  }
  if (!result.enrichment_text.empty()) absl::StrAppend(&out, "\n\n", result.enrichment_text);
  if (result.report) absl::StrAppend(&out, "\nReport: ", result.report->report_path);
  return out;
}

absl::StatusOr<RoutedResult> RequestRouter::Route(const std::string& message, const std::string& session_id,
                                                  const std::string& owner_id, const RouteOptions& options) {
  ASSIGN_OR_RETURN(Session session,
                   sessions_->GetOrCreate(session_id, owner_id.empty() ? std::string(kAnonymousOwner) : owner_id));
  TurnGate::Turn turn = turns_.Acquire(session.id);

  const std::optional<std::string> sequence = ExtractSequence(message);
  RoutedResult routed;
  routed.session_id = session.id;
  routed.kind = sequence ? RouteKind::kAnalysis : RouteKind::kChat;
  const std::string stage = sequence ? kStageRouterAnalysis : kStageRouterChat;

  // History is read before the new message is appended so it excludes it.
  std::vector<Message> history;
  if (!sequence) {
    ASSIGN_OR_RETURN(history, sessions_->RecentMessages(session.id, options_.history_window));
  }
  RETURN_IF_ERROR(sessions_->AppendMessage(session.id, Role::kUser, message));

  const std::string execution_id = tracker_->StartExecution(stage);
  const absl::Time start = absl::Now();
  absl::StatusOr<Outcome> outcome;
  if (sequence) {
    outcome = HandleAnalysis(session.id, *sequence, options);
  } else {
    outcome = HandleChat(message, history, options);
  }
  if (!outcome.ok()) {
    auto record = tracker_->EndExecution(stage, execution_id, start, 0, 0, kLocalModel, false,
                                         std::string(outcome.status().message()));
    if (!record.ok()) LOG(WARNING) << "Could not record " << stage << ": " << record.status();
    return outcome.status();
  }

  auto record = tracker_->EndExecution(stage, execution_id, start, outcome->input_tokens, outcome->output_tokens,
                                       outcome->model, outcome->success, std::string(outcome->status.message()));
  if (!record.ok()) LOG(WARNING) << "Could not record " << stage << ": " << record.status();

  RETURN_IF_ERROR(sessions_->AppendMessage(session.id, Role::kAssistant, outcome->response, outcome->metadata));

  VLOG(1) << "Routed " << RouteKindName(routed.kind) << " request for session " << session.id
          << (outcome->success ? "" : " (failed)");
  routed.success = outcome->success;
  routed.response = std::move(outcome->response);
  routed.status = outcome->status;
  routed.pipeline = std::move(outcome->pipeline);
  return routed;
}

absl::StatusOr<RequestRouter::Outcome> RequestRouter::HandleAnalysis(const std::string& session_id,
                                                                     const std::string& sequence,
                                                                     const RouteOptions& options) {
  PipelineRequest request;
  request.sequence = sequence;
  request.compare_to = options.compare_to;
  request.cancel = options.cancel;
  PipelineResult result = pipeline_->Run(request);

  Outcome outcome;
  outcome.success = result.success;
  outcome.status = result.status;
  // Pipeline stages report their own tokens; repeating them here would count
  // them twice in the summary.
  outcome.model = kLocalModel;

  if (result.success) {
    const AnalysisResult& analysis = *result.analysis;
    RETURN_IF_ERROR(sessions_->SetContext(session_id, "last_sequence", analysis.sequence));
    RETURN_IF_ERROR(sessions_->SetContext(session_id, "last_gc_percent", analysis.gc_percent));
    RETURN_IF_ERROR(sessions_->SetContext(session_id, "last_orf_count", analysis.orfs.size()));
    RETURN_IF_ERROR(sessions_->SetContext(session_id, "last_analysis_at",
                                          absl::FormatTime(absl::RFC3339_sec, absl::Now(), absl::UTCTimeZone())));
    outcome.response = FormatAnalysisResponse(result);
    outcome.metadata = {{"route", RouteKindName(RouteKind::kAnalysis)}, {"run_id", result.run_id}};
  } else {
    outcome.response =
        absl::StrCat("Analysis failed during ", result.failed_stage, ": ", result.status.message());
    outcome.metadata = ErrorMetadata(result.status, RouteKindName(RouteKind::kAnalysis));
    outcome.metadata["run_id"] = result.run_id;
    outcome.metadata["stage"] = result.failed_stage;
  }
  outcome.pipeline = std::move(result);
  return outcome;
}

RequestRouter::Outcome RequestRouter::HandleChat(const std::string& message, const std::vector<Message>& history,
                                                 const RouteOptions& options) {
  const CancellationRequest* cancel = options.cancel.get();
  Outcome outcome;
  Completion completion;
  absl::Status status;
  if (completion_ == nullptr) {
    status = PermanentCollaboratorError("no text-completion collaborator is configured");
  } else {
    status = RetryWithBackoff(options_.retry, cancel, kStageRouterChat, [&](int) -> absl::Status {
      ASSIGN_OR_RETURN(completion, completion_->Complete(kAssistantSystemPrompt, message, history, cancel));
      return absl::OkStatus();
    });
  }

  outcome.status = status;
  outcome.success = status.ok();
  if (status.ok()) {
    outcome.response = completion.text;
    outcome.input_tokens = completion.input_tokens;
    outcome.output_tokens = completion.output_tokens;
    outcome.model = completion.model.empty() ? completion_->model() : completion.model;
    outcome.metadata = {{"route", RouteKindName(RouteKind::kChat)}, {"model", outcome.model}};
  } else {
    outcome.response = absl::StrCat("I could not answer that: ", status.message());
    outcome.metadata = ErrorMetadata(status, RouteKindName(RouteKind::kChat));
    if (completion_ != nullptr) outcome.model = completion_->model();
  }
  return outcome;
}

}  // namespace geneflow
