#ifndef GENEFLOW_ANALYSIS_SEQUENCE_COMPARATOR_H_
#define GENEFLOW_ANALYSIS_SEQUENCE_COMPARATOR_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include <nlohmann/json.hpp>

#include "analysis/sequence_analyzer.h"

namespace geneflow {

struct AlignmentScoring {
  int match = 2;
  // Purine/purine or pyrimidine/pyrimidine substitution.
  int transition = -1;
  int transversion = -2;
  int gap = -3;
  double high_homology_threshold = 70.0;
  double moderate_homology_threshold = 40.0;
};

struct ComparisonResult {
  std::string query_row;
  // '|' identical, ':' transition, ' ' otherwise.
  std::string match_row;
  std::string target_row;
  int aligned_length = 0;
  int matches = 0;
  int transitions = 0;
  int gaps = 0;
  double identity_percent = 0.0;
  double similarity_percent = 0.0;
  int score = 0;
  std::string homology;
};

void to_json(nlohmann::json& j, const ComparisonResult& result);

// Global (Needleman-Wunsch) nucleotide alignment with a linear gap penalty.
// Identity counts gap columns as mismatches; similarity gives transitions
// half credit.
class SequenceComparator {
 public:
  explicit SequenceComparator(AlignmentScoring scoring = {}, size_t max_sequence_length = 1000000);

  // Both inputs are normalized and validated like SequenceAnalyzer input.
  absl::StatusOr<ComparisonResult> Compare(absl::string_view query, absl::string_view target) const;

  static bool IsTransition(char a, char b);

 private:
  int Substitution(char a, char b) const;
  std::string HomologyLabel(double similarity) const;

  AlignmentScoring scoring_;
  SequenceAnalyzer validator_;
};

}  // namespace geneflow

#endif  // GENEFLOW_ANALYSIS_SEQUENCE_COMPARATOR_H_
