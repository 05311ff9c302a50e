#include "core/pipeline_orchestrator.h"

#include <algorithm>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"

#include "core/constants.h"
#include "core/retry.h"
#include "core/session.h"

namespace geneflow {

std::string PipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::kStarted:
      return "STARTED";
    case PipelineState::kAnalyzing:
      return "ANALYZING";
    case PipelineState::kPredicting:
      return "PREDICTING";
    case PipelineState::kSkippedNoOrf:
      return "SKIPPED_NO_ORF";
    case PipelineState::kEnriching:
      return "ENRICHING";
    case PipelineState::kVisualizing:
      return "VISUALIZING";
    case PipelineState::kReporting:
      return "REPORTING";
    case PipelineState::kCompleted:
      return "COMPLETED";
    case PipelineState::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

nlohmann::json PipelineResult::ToJson() const {
  nlohmann::json states_json = nlohmann::json::array();
  for (PipelineState s : states) states_json.push_back(PipelineStateName(s));

  nlohmann::json j = {{"run_id", run_id},
                      {"success", success},
                      {"state", PipelineStateName(state())},
                      {"states", states_json},
                      {"attempts", attempts},
                      {"duration_seconds", absl::ToDoubleSeconds(duration)},
                      {"input_tokens", input_tokens},
                      {"output_tokens", output_tokens}};
  if (!success && !status.ok()) {
    j["error"] = std::string(status.message());
    j["error_kind"] = ErrorKindName(GetErrorKind(status));
    j["stage"] = failed_stage;
  }
  if (analysis) j["analysis"] = *analysis;
  j["proteins"] = proteins;
  if (comparison) j["comparison"] = *comparison;
  j["literature"] = literature;
  j["hypotheses"] = hypotheses;
  if (!enrichment_text.empty()) j["enrichment"] = enrichment_text;
  j["visualization"] = visualization;
  if (report) j["report"] = *report;
  return j;
}

PipelineOrchestrator::Builder::Builder(PerformanceTracker* tracker) : tracker_(tracker) {}

PipelineOrchestrator::Builder& PipelineOrchestrator::Builder::WithConfig(const GeneflowConfig& config) {
  config_ = config;
  return *this;
}

PipelineOrchestrator::Builder& PipelineOrchestrator::Builder::WithCompletionClient(TextCompletionClient* client) {
  completion_ = client;
  return *this;
}

PipelineOrchestrator::Builder& PipelineOrchestrator::Builder::WithLiteratureClient(LiteratureSearchClient* client) {
  literature_ = client;
  return *this;
}

PipelineOrchestrator::Builder& PipelineOrchestrator::Builder::WithVisualizationClient(VisualizationClient* client) {
  visualization_ = client;
  return *this;
}

PipelineOrchestrator::Builder& PipelineOrchestrator::Builder::WithReportClient(ReportClient* client) {
  report_ = client;
  return *this;
}

absl::StatusOr<std::unique_ptr<PipelineOrchestrator>> PipelineOrchestrator::Builder::Build() {
  if (tracker_ == nullptr) return absl::InvalidArgumentError("Pipeline requires a performance tracker");
  if (literature_ == nullptr) return absl::InvalidArgumentError("Pipeline requires a literature client");
  if (visualization_ == nullptr) return absl::InvalidArgumentError("Pipeline requires a visualization client");
  if (report_ == nullptr) return absl::InvalidArgumentError("Pipeline requires a report client");

  std::unique_ptr<PipelineOrchestrator> pipeline(new PipelineOrchestrator());
  pipeline->tracker_ = tracker_;
  pipeline->config_ = config_;
  pipeline->analyzer_ = std::make_unique<SequenceAnalyzer>(config_.analyzer);
  pipeline->predictor_ = std::make_unique<ProteinPredictor>(config_.protein);
  pipeline->comparator_ =
      std::make_unique<SequenceComparator>(config_.alignment, config_.analyzer.max_sequence_length);
  pipeline->hypotheses_ = std::make_unique<HypothesisGenerator>(config_.hypothesis);
  pipeline->completion_ = completion_;
  pipeline->literature_ = literature_;
  pipeline->visualization_ = visualization_;
  pipeline->report_ = report_;
  return pipeline;
}

std::string PipelineOrchestrator::LiteratureQuery(const AnalysisResult& analysis) {
  std::vector<std::string> terms;
  absl::flat_hash_set<std::string> seen;
  for (const auto& hit : analysis.motifs) {
    if (seen.insert(hit.name).second) terms.push_back(hit.name);
  }
  terms.push_back("gene");
  return absl::StrJoin(terms, " ");
}

absl::Status PipelineOrchestrator::RunStage(const std::string& stage, const CancellationRequest* cancel,
                                            PipelineResult* result,
                                            const std::function<absl::Status(StageUsage*)>& fn) {
  int attempts = 0;
  absl::Status status = RetryWithBackoff(
      config_.retry, cancel, stage,
      [&](int attempt) -> absl::Status {
        const std::string id = tracker_->StartExecution(stage);
        const absl::Time start = absl::Now();
        StageUsage usage;
        absl::Status attempt_status = fn(&usage);
        result->input_tokens += usage.input_tokens;
        result->output_tokens += usage.output_tokens;
        auto record = tracker_->EndExecution(stage, id, start, usage.input_tokens, usage.output_tokens, usage.model,
                                             attempt_status.ok(), std::string(attempt_status.message()),
                                             usage.tool_calls);
        if (!record.ok()) {
          LOG(WARNING) << "Could not record " << stage << " attempt " << attempt << ": " << record.status();
        }
        return attempt_status;
      },
      &attempts);
  result->attempts[stage] += attempts;
  return status;
}

absl::Status PipelineOrchestrator::Analyze(const PipelineRequest& request, PipelineResult* result) {
  const CancellationRequest* cancel = request.cancel.get();
  RETURN_IF_ERROR(RunStage(kStageAnalysis, cancel, result, [&](StageUsage*) -> absl::Status {
    ASSIGN_OR_RETURN(AnalysisResult analysis, analyzer_->Analyze(request.sequence));
    result->analysis = std::move(analysis);
    return absl::OkStatus();
  }));

  if (request.compare_to.has_value()) {
    RETURN_IF_ERROR(RunStage(kStageComparison, cancel, result, [&](StageUsage*) -> absl::Status {
      ASSIGN_OR_RETURN(ComparisonResult comparison, comparator_->Compare(request.sequence, *request.compare_to));
      result->comparison = std::move(comparison);
      return absl::OkStatus();
    }));
  }
  return absl::OkStatus();
}

absl::Status PipelineOrchestrator::Predict(const CancellationRequest* cancel, PipelineResult* result) {
  std::vector<Orf> orfs = result->analysis->orfs;
  std::stable_sort(orfs.begin(), orfs.end(), [](const Orf& a, const Orf& b) { return a.length > b.length; });
  if (static_cast<int>(orfs.size()) > config_.max_orfs_to_predict) {
    orfs.resize(static_cast<size_t>(std::max(0, config_.max_orfs_to_predict)));
  }

  return RunStage(kStagePrediction, cancel, result, [&](StageUsage*) -> absl::Status {
    std::vector<ProteinProfile> proteins;
    for (const auto& orf : orfs) {
      ASSIGN_OR_RETURN(ProteinProfile profile, predictor_->Predict(orf.sequence, orf.start, orf.end));
      proteins.push_back(std::move(profile));
    }
    result->proteins = std::move(proteins);
    return absl::OkStatus();
  });
}

absl::Status PipelineOrchestrator::Enrich(const CancellationRequest* cancel, PipelineResult* result) {
  const AnalysisResult& analysis = *result->analysis;
  const std::string query = LiteratureQuery(analysis);
  RETURN_IF_ERROR(RunStage(kStageLiterature, cancel, result, [&](StageUsage* usage) -> absl::Status {
    usage->tool_calls.push_back("literature_search");
    ASSIGN_OR_RETURN(LiteratureResult literature, literature_->Search(query, kLiteratureResults));
    result->literature = std::move(literature);
    return absl::OkStatus();
  }));

  RETURN_IF_ERROR(RunStage(kStageHypothesis, cancel, result, [&](StageUsage*) -> absl::Status {
    result->hypotheses = hypotheses_->Generate(analysis, result->proteins, result->comparison);
    return absl::OkStatus();
  }));

  if (completion_ == nullptr) return absl::OkStatus();

  nlohmann::json findings = {{"analysis", analysis},
                             {"proteins", result->proteins},
                             {"hypotheses", result->hypotheses},
                             {"literature_hits", result->literature.total_results}};
  if (result->comparison) findings["comparison"] = *result->comparison;
  const std::string prompt =
      "Analysis findings:\n" + findings.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  return RunStage(kStageNarrative, cancel, result, [&](StageUsage* usage) -> absl::Status {
    usage->model = completion_->model();
    usage->tool_calls.push_back("text_completion");
    ASSIGN_OR_RETURN(Completion completion, completion_->Complete(kEnrichmentSystemPrompt, prompt, {}, cancel));
    usage->input_tokens = completion.input_tokens;
    usage->output_tokens = completion.output_tokens;
    if (!completion.model.empty()) usage->model = completion.model;
    result->enrichment_text = std::move(completion.text);
    return absl::OkStatus();
  });
}

absl::Status PipelineOrchestrator::Visualize(const CancellationRequest* cancel, PipelineResult* result) {
  return RunStage(kStageVisualization, cancel, result, [&](StageUsage* usage) -> absl::Status {
    usage->tool_calls.push_back("render_plots");
    ASSIGN_OR_RETURN(VisualizationResult visualization, visualization_->Render(result->run_id, *result->analysis));
    result->visualization = std::move(visualization);
    return absl::OkStatus();
  });
}

absl::Status PipelineOrchestrator::Report(const CancellationRequest* cancel, PipelineResult* result) {
  return RunStage(kStageReport, cancel, result, [&](StageUsage* usage) -> absl::Status {
    usage->tool_calls.push_back("build_report");
    nlohmann::json aggregate = result->ToJson();
    aggregate.erase("report");
    ASSIGN_OR_RETURN(ReportInfo report, report_->Build(result->run_id, aggregate));
    result->report = std::move(report);
    return absl::OkStatus();
  });
}

PipelineResult PipelineOrchestrator::Run(const PipelineRequest& request) {
  PipelineResult result;
  result.run_id = request.run_id.empty() ? absl::StrCat("run_", NewSessionId()) : request.run_id;
  const CancellationRequest* cancel = request.cancel.get();
  const absl::Time started = absl::Now();
  const std::string pipeline_id = tracker_->StartExecution(kStagePipeline);
  LOG(INFO) << "Pipeline " << result.run_id << " started";

  auto enter = [&](PipelineState state) -> absl::Status {
    if (cancel != nullptr && cancel->IsCancelled()) {
      return RunCancelledError(absl::StrCat("Run cancelled before ", PipelineStateName(state), ": ",
                                            cancel->Reason()));
    }
    result.states.push_back(state);
    VLOG(1) << "Pipeline " << result.run_id << " -> " << PipelineStateName(state);
    return absl::OkStatus();
  };

  auto run_all = [&]() -> absl::Status {
    result.states.push_back(PipelineState::kStarted);
    RETURN_IF_ERROR(enter(PipelineState::kAnalyzing));
    RETURN_IF_ERROR(Analyze(request, &result));

    if (result.analysis->orfs.empty()) {
      RETURN_IF_ERROR(enter(PipelineState::kSkippedNoOrf));
    } else {
      RETURN_IF_ERROR(enter(PipelineState::kPredicting));
      RETURN_IF_ERROR(Predict(cancel, &result));
    }

    RETURN_IF_ERROR(enter(PipelineState::kEnriching));
    RETURN_IF_ERROR(Enrich(cancel, &result));
    RETURN_IF_ERROR(enter(PipelineState::kVisualizing));
    RETURN_IF_ERROR(Visualize(cancel, &result));
    RETURN_IF_ERROR(enter(PipelineState::kReporting));
    RETURN_IF_ERROR(Report(cancel, &result));
    return enter(PipelineState::kCompleted);
  };

  absl::Status status = run_all();
  if (status.ok()) {
    result.success = true;
  } else {
    result.failed_stage = PipelineStateName(result.state());
    result.status = status;
    result.states.push_back(PipelineState::kFailed);
    LOG(WARNING) << "Pipeline " << result.run_id << " failed in " << result.failed_stage << ": " << status;
  }
  result.duration = absl::Now() - started;

  // Tokens are accounted on the stage records only so that totals are not counted twice.
  auto record = tracker_->EndExecution(kStagePipeline, pipeline_id, started, 0, 0, kLocalModel, result.success,
                                       std::string(status.message()));
  if (!record.ok()) LOG(WARNING) << "Could not record pipeline run " << result.run_id << ": " << record.status();

  if (result.success) {
    LOG(INFO) << "Pipeline " << result.run_id << " completed in " << result.duration;
  }
  return result;
}

}  // namespace geneflow
