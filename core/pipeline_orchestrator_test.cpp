#include "core/pipeline_orchestrator.h"

#include <deque>

#include <gtest/gtest.h>

#include "core/errors.h"

namespace geneflow {
namespace {

// Fails with the queued statuses first, then succeeds.
class ScriptedFailures {
 public:
  void Queue(absl::Status status, int times = 1) {
    for (int i = 0; i < times; ++i) failures_.push_back(status);
  }
  absl::Status Next() {
    ++calls;
    if (failures_.empty()) return absl::OkStatus();
    absl::Status s = failures_.front();
    failures_.pop_front();
    return s;
  }
  int calls = 0;

 private:
  std::deque<absl::Status> failures_;
};

class FakeLiterature : public LiteratureSearchClient {
 public:
  absl::StatusOr<LiteratureResult> Search(const std::string& query, int max_results) override {
    last_query = query;
    RETURN_IF_ERROR(script.Next());
    LiteratureResult result;
    result.total_results = 1;
    Paper paper;
    paper.id = "PMID:1";
    paper.title = "Paper about " + query;
    paper.year = 1993;
    result.papers.push_back(paper);
    (void)max_results;
    return result;
  }
  ScriptedFailures script;
  std::string last_query;
};

class FakeVisualization : public VisualizationClient {
 public:
  absl::StatusOr<VisualizationResult> Render(const std::string& run_id, const AnalysisResult& analysis) override {
    RETURN_IF_ERROR(script.Next());
    VisualizationResult result;
    result.plots.push_back({"gc_profile", run_id + "_gc.json", "json"});
    (void)analysis;
    return result;
  }
  ScriptedFailures script;
};

class FakeReport : public ReportClient {
 public:
  absl::StatusOr<ReportInfo> Build(const std::string& run_id, const nlohmann::json& aggregate) override {
    RETURN_IF_ERROR(script.Next());
    last_aggregate = aggregate;
    ReportInfo info;
    info.report_path = run_id + "_report.json";
    info.page_count = 1;
    info.file_size_bytes = 10;
    return info;
  }
  ScriptedFailures script;
  nlohmann::json last_aggregate;
};

class FakeCompletion : public TextCompletionClient {
 public:
  absl::StatusOr<Completion> Complete(const std::string& system_prompt, const std::string& prompt,
                                      const std::vector<Message>& history,
                                      const CancellationRequest* cancel) override {
    (void)system_prompt;
    (void)history;
    (void)cancel;
    last_prompt = prompt;
    RETURN_IF_ERROR(script.Next());
    return Completion{"The sequence carries a TATA box.", 100, 20, "fake-model"};
  }
  std::string model() const override { return "fake-model"; }
  ScriptedFailures script;
  std::string last_prompt;
};

constexpr char kSequence[] = "GGTATAAAGGATGAAATAAGG";

class PipelineOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tracker = std::make_unique<PerformanceTracker>(nullptr, DefaultPriceTable());
    config = DefaultConfig();
    config.retry.initial_backoff = absl::Milliseconds(1);
    config.retry.max_backoff = absl::Milliseconds(2);
  }

  std::unique_ptr<PipelineOrchestrator> Make(TextCompletionClient* completion = nullptr) {
    auto pipeline = PipelineOrchestrator::Builder(tracker.get())
                        .WithConfig(config)
                        .WithCompletionClient(completion)
                        .WithLiteratureClient(&literature)
                        .WithVisualizationClient(&visualization)
                        .WithReportClient(&report)
                        .Build();
    EXPECT_TRUE(pipeline.ok()) << pipeline.status();
    return pipeline.ok() ? std::move(*pipeline) : nullptr;
  }

  std::vector<std::string> StateNames(const PipelineResult& result) {
    std::vector<std::string> names;
    for (PipelineState s : result.states) names.push_back(PipelineStateName(s));
    return names;
  }

  std::unique_ptr<PerformanceTracker> tracker;
  GeneflowConfig config;
  FakeLiterature literature;
  FakeVisualization visualization;
  FakeReport report;
};

TEST_F(PipelineOrchestratorTest, BuilderRequiresCollaborators) {
  EXPECT_FALSE(PipelineOrchestrator::Builder(tracker.get()).Build().ok());
  EXPECT_FALSE(PipelineOrchestrator::Builder(nullptr)
                   .WithLiteratureClient(&literature)
                   .WithVisualizationClient(&visualization)
                   .WithReportClient(&report)
                   .Build()
                   .ok());
}

TEST_F(PipelineOrchestratorTest, CompletesFullRun) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  request.run_id = "run-full";
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  EXPECT_EQ(result.state(), PipelineState::kCompleted);
  EXPECT_EQ(StateNames(result), (std::vector<std::string>{"STARTED", "ANALYZING", "PREDICTING", "ENRICHING",
                                                         "VISUALIZING", "REPORTING", "COMPLETED"}));
  ASSERT_TRUE(result.analysis.has_value());
  ASSERT_EQ(result.proteins.size(), 1);
  EXPECT_EQ(result.proteins[0].aa_sequence, "MK");
  EXPECT_FALSE(result.hypotheses.empty());
  EXPECT_EQ(result.literature.total_results, 1);
  EXPECT_EQ(literature.last_query, "TATA_box gene");
  ASSERT_EQ(result.visualization.plots.size(), 1);
  ASSERT_TRUE(result.report.has_value());
  EXPECT_EQ(result.report->report_path, "run-full_report.json");
  EXPECT_EQ(report.last_aggregate["run_id"], "run-full");
  EXPECT_TRUE(result.enrichment_text.empty());

  nlohmann::json j = result.ToJson();
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["state"], "COMPLETED");
  EXPECT_FALSE(j.contains("error"));

  PerformanceSummary summary = tracker->Summary();
  EXPECT_EQ(summary.by_stage["pipeline"].count, 1);
  EXPECT_EQ(summary.by_stage["analysis"].count, 1);
  EXPECT_EQ(summary.by_stage["report"].count, 1);
}

TEST_F(PipelineOrchestratorTest, TransientFailuresAreRetried) {
  literature.script.Queue(absl::UnavailableError("literature service down"), 2);
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  EXPECT_EQ(result.state(), PipelineState::kCompleted);
  EXPECT_EQ(result.attempts["literature"], 3);
  EXPECT_EQ(literature.script.calls, 3);

  PerformanceSummary summary = tracker->Summary();
  EXPECT_EQ(summary.by_stage["literature"].count, 3);
  EXPECT_EQ(summary.by_stage["literature"].failed, 2);
  EXPECT_EQ(summary.by_stage["literature"].successful, 1);
}

TEST_F(PipelineOrchestratorTest, ExhaustedRetriesFail) {
  visualization.script.Queue(absl::ResourceExhaustedError("rate limited"), 5);
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  PipelineResult result = pipeline->Run(request);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.state(), PipelineState::kFailed);
  EXPECT_EQ(result.failed_stage, "VISUALIZING");
  EXPECT_EQ(result.attempts["visualization"], 3);
  EXPECT_TRUE(IsTransient(result.status));
}

TEST_F(PipelineOrchestratorTest, PermanentFailureAbortsImmediately) {
  report.script.Queue(PermanentCollaboratorError("report template missing"));
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  PipelineResult result = pipeline->Run(request);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed_stage, "REPORTING");
  EXPECT_EQ(result.attempts["report"], 1);
  nlohmann::json j = result.ToJson();
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["stage"], "REPORTING");
  EXPECT_EQ(j["error_kind"], "permanent_collaborator");
  EXPECT_EQ(j["error"], "report template missing");

  PerformanceSummary summary = tracker->Summary();
  EXPECT_EQ(summary.by_stage["pipeline"].failed, 1);
}

TEST_F(PipelineOrchestratorTest, InvalidSequenceFailsInAnalysis) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = "XYZ123";
  PipelineResult result = pipeline->Run(request);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed_stage, "ANALYZING");
  EXPECT_EQ(GetErrorKind(result.status), ErrorKind::kInvalidSequence);
  EXPECT_EQ(result.attempts["analysis"], 1);
  EXPECT_EQ(literature.script.calls, 0);
}

TEST_F(PipelineOrchestratorTest, NoOrfSkipsPrediction) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = "GGGGCCCCAAAATTTT";
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  EXPECT_EQ(result.states[2], PipelineState::kSkippedNoOrf);
  EXPECT_TRUE(result.proteins.empty());
  EXPECT_EQ(result.attempts.count("prediction"), 0);
}

TEST_F(PipelineOrchestratorTest, CancelledRunFails) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  request.cancel = std::make_shared<CancellationRequest>();
  request.cancel->Cancel("user stopped the run");
  PipelineResult result = pipeline->Run(request);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.state(), PipelineState::kFailed);
  EXPECT_EQ(GetErrorKind(result.status), ErrorKind::kCancelled);
  EXPECT_FALSE(result.analysis.has_value());
}

TEST_F(PipelineOrchestratorTest, ExpiredDeadlineFails) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  request.cancel = CancellationRequest::WithDeadline(absl::Now() - absl::Seconds(1));
  PipelineResult result = pipeline->Run(request);
  EXPECT_EQ(GetErrorKind(result.status), ErrorKind::kCancelled);
}

TEST_F(PipelineOrchestratorTest, ComparisonRunsDuringAnalysis) {
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  request.compare_to = kSequence;
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  ASSERT_TRUE(result.comparison.has_value());
  EXPECT_DOUBLE_EQ(result.comparison->identity_percent, 100.0);
  EXPECT_EQ(result.attempts["comparison"], 1);
}

TEST_F(PipelineOrchestratorTest, NarrativeUsesCompletionClient) {
  FakeCompletion completion;
  completion.script.Queue(absl::UnavailableError("model overloaded"));
  auto pipeline = Make(&completion);
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  request.sequence = kSequence;
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  EXPECT_EQ(result.enrichment_text, "The sequence carries a TATA box.");
  EXPECT_EQ(result.attempts["narrative"], 2);
  EXPECT_EQ(result.input_tokens, 100);
  EXPECT_EQ(result.output_tokens, 20);
  EXPECT_NE(completion.last_prompt.find("TATA_box"), std::string::npos);

  PerformanceSummary summary = tracker->Summary();
  EXPECT_EQ(summary.input_tokens, 100);
  EXPECT_GT(summary.by_stage["narrative"].total_cost, 0.0);
}

TEST_F(PipelineOrchestratorTest, PredictsLongestOrfsFirst) {
  config.max_orfs_to_predict = 1;
  auto pipeline = Make();
  ASSERT_NE(pipeline, nullptr);
  PipelineRequest request;
  // ATG AAA TAA at 0 and ATG CCC GGG TAA at 9.
  request.sequence = "ATGAAATAAATGCCCGGGTAA";
  PipelineResult result = pipeline->Run(request);

  ASSERT_TRUE(result.success) << result.status;
  ASSERT_EQ(result.proteins.size(), 1);
  EXPECT_EQ(result.proteins[0].aa_sequence, "MPG");
}

}  // namespace
}  // namespace geneflow
