#ifndef GENEFLOW_ANALYSIS_HYPOTHESIS_GENERATOR_H_
#define GENEFLOW_ANALYSIS_HYPOTHESIS_GENERATOR_H_

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis/protein_predictor.h"
#include "analysis/sequence_analyzer.h"
#include "analysis/sequence_comparator.h"

namespace geneflow {

struct Hypothesis {
  std::string statement;
  double confidence = 0.0;
  std::string evidence;
  std::vector<std::string> suggested_experiments;
};

void to_json(nlohmann::json& j, const Hypothesis& hypothesis);

struct HypothesisOptions {
  // Hypotheses below this confidence are dropped.
  double min_confidence = 0.0;
  // Mean hydropathy at or above this marks a protein as hydrophobic.
  double hydrophobic_threshold = 1.0;
};

// Rule-based hypotheses over typed analysis findings. Always yields at least
// the general characterization hypothesis unless it is filtered out by
// min_confidence.
class HypothesisGenerator {
 public:
  explicit HypothesisGenerator(HypothesisOptions options = {}) : options_(options) {}

  std::vector<Hypothesis> Generate(const AnalysisResult& analysis, const std::vector<ProteinProfile>& proteins,
                                   const std::optional<ComparisonResult>& comparison = std::nullopt) const;

 private:
  HypothesisOptions options_;
};

}  // namespace geneflow

#endif  // GENEFLOW_ANALYSIS_HYPOTHESIS_GENERATOR_H_
