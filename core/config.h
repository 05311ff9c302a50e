#ifndef GENEFLOW_CORE_CONFIG_H_
#define GENEFLOW_CORE_CONFIG_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "analysis/hypothesis_generator.h"
#include "analysis/protein_predictor.h"
#include "analysis/sequence_analyzer.h"
#include "analysis/sequence_comparator.h"
#include "core/performance_tracker.h"
#include "core/retry.h"

namespace geneflow {

struct GeneflowConfig {
  AnalyzerOptions analyzer;
  ProteinOptions protein;
  AlignmentScoring alignment;
  HypothesisOptions hypothesis;
  RetryPolicy retry;
  PriceTable prices = DefaultPriceTable();
  std::string default_model = "gpt-4o-mini";
  absl::Duration max_session_age = absl::Hours(24);
  int history_window = 10;
  int max_orfs_to_predict = 5;
};

GeneflowConfig DefaultConfig();

/**
 * @brief Layers a JSON document over the compiled defaults.
 *
 * Unknown keys are ignored with a warning; keys present with the wrong type
 * or an out-of-range value are an InvalidArgument error naming the key.
 * Durations are given in seconds. Example:
 *
 *   {"max_sequence_length": 50000, "scan_reverse_strand": true,
 *    "retry": {"max_attempts": 5, "initial_backoff_seconds": 0.5},
 *    "models": {"my-model": {"input": 0.1, "output": 0.4}},
 *    "motifs": {"GC_box": "GGGCGG"}}
 */
absl::StatusOr<GeneflowConfig> ParseConfig(const std::string& json_text);

// Reads and parses `path`. An empty path yields the defaults.
absl::StatusOr<GeneflowConfig> LoadConfig(const std::string& path);

}  // namespace geneflow

#endif  // GENEFLOW_CORE_CONFIG_H_
