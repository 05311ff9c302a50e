#ifndef GENEFLOW_CORE_LOCAL_COLLABORATORS_H_
#define GENEFLOW_CORE_LOCAL_COLLABORATORS_H_

#include <string>

#include "core/collaborators.h"

namespace geneflow {

// Literature search for offline runs: every query succeeds with no papers.
class OfflineLiteratureClient : public LiteratureSearchClient {
 public:
  absl::StatusOr<LiteratureResult> Search(const std::string& query, int max_results) override;
};

// Writes plot data as JSON documents under `output_dir`:
//   <run_id>_gc_profile.json  sliding-window GC content
//   <run_id>_orf_map.json     ORF coordinates along the sequence
class JsonVisualizationWriter : public VisualizationClient {
 public:
  static constexpr int kGcWindow = 100;
  static constexpr int kGcStep = 10;

  explicit JsonVisualizationWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

  absl::StatusOr<VisualizationResult> Render(const std::string& run_id, const AnalysisResult& analysis) override;

  // (position, gc_percent) pairs, positions at window centers.
  static nlohmann::json GcProfile(const std::string& sequence, int window = kGcWindow, int step = kGcStep);

 private:
  std::string output_dir_;
};

// Writes the pipeline aggregate to <output_dir>/<run_id>_report.json.
class JsonReportWriter : public ReportClient {
 public:
  explicit JsonReportWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

  absl::StatusOr<ReportInfo> Build(const std::string& run_id, const nlohmann::json& aggregate) override;

 private:
  std::string output_dir_;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_LOCAL_COLLABORATORS_H_
