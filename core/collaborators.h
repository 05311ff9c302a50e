#ifndef GENEFLOW_CORE_COLLABORATORS_H_
#define GENEFLOW_CORE_COLLABORATORS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include <nlohmann/json.hpp>

#include "analysis/sequence_analyzer.h"
#include "core/cancellation.h"
#include "core/session.h"

namespace geneflow {

// External services the core talks to. Implementations report failures with
// the collaborator error codes: ResourceExhausted, Unavailable and
// DeadlineExceeded are retried, everything else aborts the run.

struct Completion {
  std::string text;
  int input_tokens = 0;
  int output_tokens = 0;
  std::string model;
};

class TextCompletionClient {
 public:
  virtual ~TextCompletionClient() = default;

  // `history` is oldest first and excludes `prompt`.
  virtual absl::StatusOr<Completion> Complete(const std::string& system_prompt, const std::string& prompt,
                                              const std::vector<Message>& history,
                                              const CancellationRequest* cancel) = 0;

  virtual std::string model() const = 0;
};

struct Paper {
  std::string id;
  std::string title;
  std::vector<std::string> authors;
  int year = 0;
  std::string abstract_text;
};

struct LiteratureResult {
  int total_results = 0;
  std::vector<Paper> papers;
};

void to_json(nlohmann::json& j, const Paper& paper);
void to_json(nlohmann::json& j, const LiteratureResult& result);

class LiteratureSearchClient {
 public:
  virtual ~LiteratureSearchClient() = default;
  virtual absl::StatusOr<LiteratureResult> Search(const std::string& query, int max_results) = 0;
};

struct Plot {
  std::string name;
  std::string path;
  std::string format;
};

struct VisualizationResult {
  std::vector<Plot> plots;
};

void to_json(nlohmann::json& j, const Plot& plot);
void to_json(nlohmann::json& j, const VisualizationResult& result);

class VisualizationClient {
 public:
  virtual ~VisualizationClient() = default;
  virtual absl::StatusOr<VisualizationResult> Render(const std::string& run_id, const AnalysisResult& analysis) = 0;
};

struct ReportInfo {
  std::string report_path;
  int page_count = 0;
  int64_t file_size_bytes = 0;
};

void to_json(nlohmann::json& j, const ReportInfo& info);

class ReportClient {
 public:
  virtual ~ReportClient() = default;
  // `aggregate` is the serialized pipeline result so far.
  virtual absl::StatusOr<ReportInfo> Build(const std::string& run_id, const nlohmann::json& aggregate) = 0;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_COLLABORATORS_H_
