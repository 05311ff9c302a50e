#ifndef GENEFLOW_ANALYSIS_PROTEIN_PREDICTOR_H_
#define GENEFLOW_ANALYSIS_PROTEIN_PREDICTOR_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include <nlohmann/json.hpp>

#include "analysis/genetic_code.h"

namespace geneflow {

// Thresholds for the N-terminal signal-peptide heuristic. This is a coarse
// screen (hydrophobic h-region after a positively charged n-region), not a
// trained classifier.
struct SignalPeptideOptions {
  int min_length = 20;
  // Residues 2..window (1-based) form the h-region candidate.
  int window = 20;
  double hydrophobicity_threshold = 1.5;
  int n_region_length = 5;
  int min_positive_charges = 1;
};

struct ProteinOptions {
  CodonTable genetic_code = StandardGeneticCode();
  ResidueTable residue_masses = AverageResidueMasses();
  ResidueTable hydropathy = KyteDoolittleScale();
  SignalPeptideOptions signal_peptide;
};

struct ProteinProfile {
  std::string orf_id;
  std::string aa_sequence;
  int length = 0;
  double molecular_weight = 0.0;
  double hydrophobicity = 0.0;
  bool signal_peptide = false;
};

void to_json(nlohmann::json& j, const ProteinProfile& profile);

class ProteinPredictor {
 public:
  explicit ProteinPredictor(ProteinOptions options = {});

  // Translates `orf_sequence` and estimates its properties. The ORF must start
  // with ATG and have a length divisible by 3, otherwise an invalid-ORF error
  // is returned. `start`/`end` only label the result.
  absl::StatusOr<ProteinProfile> Predict(absl::string_view orf_sequence, int start = 0, int end = -1) const;

  // Stops at the first stop codon. Codons missing from the table become 'X'.
  std::string Translate(absl::string_view dna) const;

  // Average residue masses plus one water for the free termini. 0 for "".
  double MolecularWeight(absl::string_view protein) const;

  double MeanHydropathy(absl::string_view protein) const;

  bool HasSignalPeptide(absl::string_view protein) const;

 private:
  ProteinOptions options_;
};

}  // namespace geneflow

#endif  // GENEFLOW_ANALYSIS_PROTEIN_PREDICTOR_H_
