#include "analysis/sequence_comparator.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "analysis/genetic_code.h"
#include "core/errors.h"

namespace geneflow {

namespace {

// Upper bound on the DP matrix size; roughly 100 MB of scores.
constexpr size_t kMaxAlignmentCells = 25000000;

double RoundToOneDecimal(double value) { return std::round(value * 10.0) / 10.0; }

AnalyzerOptions ValidatorOptions(size_t max_sequence_length) {
  AnalyzerOptions options;
  options.max_sequence_length = max_sequence_length;
  options.motifs.clear();
  return options;
}

}  // namespace

void to_json(nlohmann::json& j, const ComparisonResult& result) {
  j = nlohmann::json{{"query_row", result.query_row},
                     {"match_row", result.match_row},
                     {"target_row", result.target_row},
                     {"aligned_length", result.aligned_length},
                     {"matches", result.matches},
                     {"transitions", result.transitions},
                     {"gaps", result.gaps},
                     {"identity_percent", result.identity_percent},
                     {"similarity_percent", result.similarity_percent},
                     {"score", result.score},
                     {"homology", result.homology}};
}

SequenceComparator::SequenceComparator(AlignmentScoring scoring, size_t max_sequence_length)
    : scoring_(scoring), validator_(ValidatorOptions(max_sequence_length)) {}

bool SequenceComparator::IsTransition(char a, char b) {
  auto purine = [](char c) { return c == 'A' || c == 'G'; };
  auto pyrimidine = [](char c) { return c == 'C' || c == 'T'; };
  return a != b && ((purine(a) && purine(b)) || (pyrimidine(a) && pyrimidine(b)));
}

int SequenceComparator::Substitution(char a, char b) const {
  if (a == b && a != 'N') return scoring_.match;
  if (IsTransition(a, b)) return scoring_.transition;
  return scoring_.transversion;
}

std::string SequenceComparator::HomologyLabel(double similarity) const {
  if (similarity >= scoring_.high_homology_threshold) return "high homology";
  if (similarity >= scoring_.moderate_homology_threshold) return "moderate homology";
  return "low homology";
}

absl::StatusOr<ComparisonResult> SequenceComparator::Compare(absl::string_view query, absl::string_view target) const {
  std::string a = SequenceAnalyzer::Normalize(query);
  std::string b = SequenceAnalyzer::Normalize(target);
  RETURN_IF_ERROR(validator_.Validate(a));
  RETURN_IF_ERROR(validator_.Validate(b));
  a = ToDnaAlphabet(a);
  b = ToDnaAlphabet(b);

  const size_t n = a.size();
  const size_t m = b.size();
  if ((n + 1) * (m + 1) > kMaxAlignmentCells) {
    return InvalidSequenceError(absl::StrCat("Sequences too long to align (", n, " x ", m, ")"));
  }

  const size_t cols = m + 1;
  std::vector<int> score((n + 1) * cols);
  auto at = [&](size_t i, size_t j) -> int& { return score[i * cols + j]; };
  for (size_t i = 0; i <= n; ++i) at(i, 0) = static_cast<int>(i) * scoring_.gap;
  for (size_t j = 0; j <= m; ++j) at(0, j) = static_cast<int>(j) * scoring_.gap;
  for (size_t i = 1; i <= n; ++i) {
    for (size_t j = 1; j <= m; ++j) {
      int diag = at(i - 1, j - 1) + Substitution(a[i - 1], b[j - 1]);
      int up = at(i - 1, j) + scoring_.gap;
      int left = at(i, j - 1) + scoring_.gap;
      at(i, j) = std::max({diag, up, left});
    }
  }

  ComparisonResult result;
  result.score = at(n, m);
  size_t i = n;
  size_t j = m;
  while (i > 0 || j > 0) {
    if (i > 0 && j > 0 && at(i, j) == at(i - 1, j - 1) + Substitution(a[i - 1], b[j - 1])) {
      char qa = a[i - 1];
      char tb = b[j - 1];
      result.query_row += qa;
      result.target_row += tb;
      if (qa == tb && qa != 'N') {
        result.match_row += '|';
        ++result.matches;
      } else if (IsTransition(qa, tb)) {
        result.match_row += ':';
        ++result.transitions;
      } else {
        result.match_row += ' ';
      }
      --i;
      --j;
    } else if (i > 0 && at(i, j) == at(i - 1, j) + scoring_.gap) {
      result.query_row += a[i - 1];
      result.target_row += '-';
      result.match_row += ' ';
      ++result.gaps;
      --i;
    } else {
      result.query_row += '-';
      result.target_row += b[j - 1];
      result.match_row += ' ';
      ++result.gaps;
      --j;
    }
  }
  std::reverse(result.query_row.begin(), result.query_row.end());
  std::reverse(result.match_row.begin(), result.match_row.end());
  std::reverse(result.target_row.begin(), result.target_row.end());

  result.aligned_length = static_cast<int>(result.query_row.size());
  const double columns = static_cast<double>(result.aligned_length);
  result.identity_percent = RoundToOneDecimal(100.0 * result.matches / columns);
  result.similarity_percent = RoundToOneDecimal(100.0 * (result.matches + 0.5 * result.transitions) / columns);
  result.homology = HomologyLabel(result.similarity_percent);

  VLOG(1) << "Aligned " << n << " x " << m << " nt: identity " << result.identity_percent << "%, score "
          << result.score;
  return result;
}

}  // namespace geneflow
