#ifndef GENEFLOW_CORE_PIPELINE_ORCHESTRATOR_H_
#define GENEFLOW_CORE_PIPELINE_ORCHESTRATOR_H_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

#include "analysis/hypothesis_generator.h"
#include "analysis/protein_predictor.h"
#include "analysis/sequence_analyzer.h"
#include "analysis/sequence_comparator.h"
#include "core/cancellation.h"
#include "core/collaborators.h"
#include "core/config.h"
#include "core/errors.h"
#include "core/performance_tracker.h"

namespace geneflow {

enum class PipelineState {
  kStarted,
  kAnalyzing,
  kPredicting,
  kSkippedNoOrf,
  kEnriching,
  kVisualizing,
  kReporting,
  kCompleted,
  kFailed,
};

std::string PipelineStateName(PipelineState state);

// Names under which stage attempts are reported to the PerformanceTracker.
inline constexpr char kStageAnalysis[] = "analysis";
inline constexpr char kStageComparison[] = "comparison";
inline constexpr char kStagePrediction[] = "prediction";
inline constexpr char kStageLiterature[] = "literature";
inline constexpr char kStageHypothesis[] = "hypothesis";
inline constexpr char kStageNarrative[] = "narrative";
inline constexpr char kStageVisualization[] = "visualization";
inline constexpr char kStageReport[] = "report";
inline constexpr char kStagePipeline[] = "pipeline";

// Model label for stages that run locally and spend no tokens.
inline constexpr char kLocalModel[] = "local";

struct PipelineRequest {
  std::string sequence;
  // Aligned against `sequence` during ANALYZING when set.
  std::optional<std::string> compare_to;
  // Generated when empty. Used to name artifacts.
  std::string run_id;
  std::shared_ptr<CancellationRequest> cancel;
};

struct PipelineResult {
  std::string run_id;
  bool success = false;
  absl::Status status;
  // State that was active when the run failed.
  std::string failed_stage;

  std::optional<AnalysisResult> analysis;
  std::vector<ProteinProfile> proteins;
  std::optional<ComparisonResult> comparison;
  LiteratureResult literature;
  std::vector<Hypothesis> hypotheses;
  std::string enrichment_text;
  VisualizationResult visualization;
  std::optional<ReportInfo> report;

  absl::Duration duration;
  std::vector<PipelineState> states;
  // Calls made per tracked stage, retries included.
  std::map<std::string, int> attempts;
  int input_tokens = 0;
  int output_tokens = 0;

  PipelineState state() const { return states.empty() ? PipelineState::kStarted : states.back(); }

  // {success:false, error, error_kind, stage} on failure, the full bundle otherwise.
  nlohmann::json ToJson() const;
};

// Runs one sequence through analysis, prediction, enrichment, visualization
// and reporting. Each stage attempt is reported to the tracker and each
// collaborator call is retried on transient failures. A run never returns an
// error directly; failures are described by the result.
class PipelineOrchestrator {
 public:
  class Builder {
   public:
    explicit Builder(PerformanceTracker* tracker);

    Builder& WithConfig(const GeneflowConfig& config);
    // Optional; without one ENRICHING produces no narrative.
    Builder& WithCompletionClient(TextCompletionClient* client);
    Builder& WithLiteratureClient(LiteratureSearchClient* client);
    Builder& WithVisualizationClient(VisualizationClient* client);
    Builder& WithReportClient(ReportClient* client);

    absl::StatusOr<std::unique_ptr<PipelineOrchestrator>> Build();

   private:
    PerformanceTracker* tracker_;
    GeneflowConfig config_;
    TextCompletionClient* completion_ = nullptr;
    LiteratureSearchClient* literature_ = nullptr;
    VisualizationClient* visualization_ = nullptr;
    ReportClient* report_ = nullptr;
  };

  PipelineResult Run(const PipelineRequest& request);

  static constexpr int kLiteratureResults = 5;

  // Motif names (deduplicated, first-seen order) followed by "gene".
  static std::string LiteratureQuery(const AnalysisResult& analysis);

 private:
  friend class Builder;

  struct StageUsage {
    int input_tokens = 0;
    int output_tokens = 0;
    std::string model = kLocalModel;
    std::vector<std::string> tool_calls;
  };

  PipelineOrchestrator() = default;

  // Runs `fn` under the retry policy, reporting each attempt as `stage`.
  absl::Status RunStage(const std::string& stage, const CancellationRequest* cancel, PipelineResult* result,
                        const std::function<absl::Status(StageUsage*)>& fn);

  absl::Status Analyze(const PipelineRequest& request, PipelineResult* result);
  absl::Status Predict(const CancellationRequest* cancel, PipelineResult* result);
  absl::Status Enrich(const CancellationRequest* cancel, PipelineResult* result);
  absl::Status Visualize(const CancellationRequest* cancel, PipelineResult* result);
  absl::Status Report(const CancellationRequest* cancel, PipelineResult* result);

  PerformanceTracker* tracker_ = nullptr;
  GeneflowConfig config_;
  std::unique_ptr<SequenceAnalyzer> analyzer_;
  std::unique_ptr<ProteinPredictor> predictor_;
  std::unique_ptr<SequenceComparator> comparator_;
  std::unique_ptr<HypothesisGenerator> hypotheses_;
  TextCompletionClient* completion_ = nullptr;
  LiteratureSearchClient* literature_ = nullptr;
  VisualizationClient* visualization_ = nullptr;
  ReportClient* report_ = nullptr;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_PIPELINE_ORCHESTRATOR_H_
