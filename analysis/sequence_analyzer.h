#ifndef GENEFLOW_ANALYSIS_SEQUENCE_ANALYZER_H_
#define GENEFLOW_ANALYSIS_SEQUENCE_ANALYZER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include <nlohmann/json.hpp>

namespace geneflow {

// A named regulatory pattern. Each pattern position is a base, an IUPAC
// ambiguity code (R, Y, K, M, S, W, B, D, H, V, N) or a bracketed class such
// as "[AG]".
struct MotifPattern {
  std::string name;
  std::string pattern;
};

std::vector<MotifPattern> DefaultMotifs();

// Returns OK if `pattern` compiles to a non-empty base-mask sequence.
absl::Status ValidateMotifPattern(absl::string_view pattern);

struct AnalyzerOptions {
  size_t max_sequence_length = 1000000;
  // Minimum ORF length in nucleotides, stop codon included. 0 keeps every ORF.
  int min_orf_length = 0;
  bool scan_reverse_strand = false;
  // Output bounds. Nested ORFs sharing one stop codon grow quadratically in
  // stored bases, so scanning stops once either limit would be exceeded.
  size_t max_orfs = 10000;
  size_t max_orf_bases = 16 << 20;
  std::vector<MotifPattern> motifs = DefaultMotifs();
};

enum class SequenceType { kDna, kRna };

std::string SequenceTypeName(SequenceType type);

// Half-open [start, end) on the forward strand, 0-based. Frames 1..3 are
// forward, -1..-3 reverse complement.
struct Orf {
  int start = 0;
  int end = 0;
  std::string sequence;
  int length = 0;
  int frame = 1;

  std::string Id() const;
};

struct MotifHit {
  std::string name;
  int position = 0;
  std::string match;
};

struct AnalysisResult {
  bool valid = false;
  SequenceType type = SequenceType::kDna;
  std::string sequence;
  int length = 0;
  double gc_percent = 0.0;
  std::vector<Orf> orfs;
  // Set when the ORF list was cut short by max_orfs or max_orf_bases.
  bool orfs_truncated = false;
  std::vector<MotifHit> motifs;
};

void to_json(nlohmann::json& j, const Orf& orf);
void to_json(nlohmann::json& j, const MotifHit& hit);
void to_json(nlohmann::json& j, const AnalysisResult& result);

class SequenceAnalyzer {
 public:
  explicit SequenceAnalyzer(AnalyzerOptions options = {});

  // Normalizes, validates and analyzes `raw`. Fails with an invalid-sequence
  // error for empty input, characters outside {A,C,G,T,U,N} or input longer
  // than the configured maximum.
  absl::StatusOr<AnalysisResult> Analyze(absl::string_view raw) const;

  // Drops FASTA header lines, whitespace and digits and uppercases the rest.
  static std::string Normalize(absl::string_view raw);

  absl::Status Validate(absl::string_view cleaned) const;

  // Percentage of G and C, rounded to one decimal. `seq` must not be empty.
  static double GcPercent(absl::string_view seq);

  // `dna` must be in the DNA alphabet (no U). Sets `*truncated` when the
  // output limits cut the list short.
  std::vector<Orf> FindOrfs(absl::string_view dna, bool* truncated = nullptr) const;
  std::vector<MotifHit> ScanMotifs(absl::string_view dna) const;

  const AnalyzerOptions& options() const { return options_; }

 private:
  struct CompiledMotif {
    std::string name;
    std::vector<uint8_t> masks;
  };

  struct OrfBudget {
    size_t orfs_left = 0;
    size_t bases_left = 0;
    bool exhausted = false;
  };

  static void ScanForwardOrfs(absl::string_view dna, int min_length, OrfBudget* budget, std::vector<Orf>* out);

  AnalyzerOptions options_;
  std::vector<CompiledMotif> compiled_motifs_;
};

}  // namespace geneflow

#endif  // GENEFLOW_ANALYSIS_SEQUENCE_ANALYZER_H_
