#include "analysis/protein_predictor.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "core/errors.h"

namespace geneflow {

void to_json(nlohmann::json& j, const ProteinProfile& profile) {
  j = nlohmann::json{{"orf_id", profile.orf_id},
                     {"aa_sequence", profile.aa_sequence},
                     {"length", profile.length},
                     {"molecular_weight", profile.molecular_weight},
                     {"hydrophobicity", profile.hydrophobicity},
                     {"signal_peptide", profile.signal_peptide}};
}

ProteinPredictor::ProteinPredictor(ProteinOptions options) : options_(std::move(options)) {}

absl::StatusOr<ProteinProfile> ProteinPredictor::Predict(absl::string_view orf_sequence, int start, int end) const {
  std::string dna = absl::AsciiStrToUpper(orf_sequence);
  std::replace(dna.begin(), dna.end(), 'U', 'T');
  if (dna.size() < 3 || !IsStartCodon(absl::string_view(dna).substr(0, 3))) {
    return InvalidOrfError("ORF must begin with the start codon ATG");
  }
  if (dna.size() % 3 != 0) {
    return InvalidOrfError(absl::StrCat("ORF length ", dna.size(), " is not a multiple of 3"));
  }

  ProteinProfile profile;
  if (end < 0) end = start + static_cast<int>(dna.size());
  profile.orf_id = absl::StrCat("ORF_", start, "_", end);
  profile.aa_sequence = Translate(dna);
  profile.length = static_cast<int>(profile.aa_sequence.size());
  profile.molecular_weight = MolecularWeight(profile.aa_sequence);
  profile.hydrophobicity = MeanHydropathy(profile.aa_sequence);
  profile.signal_peptide = HasSignalPeptide(profile.aa_sequence);
  VLOG(1) << profile.orf_id << ": " << profile.length << " aa, " << profile.molecular_weight << " Da";
  return profile;
}

std::string ProteinPredictor::Translate(absl::string_view dna) const {
  std::string protein;
  protein.reserve(dna.size() / 3);
  for (size_t i = 0; i + 3 <= dna.size(); i += 3) {
    auto it = options_.genetic_code.find(dna.substr(i, 3));
    if (it == options_.genetic_code.end()) {
      protein += kUnknownResidue;
      continue;
    }
    if (it->second == kStopResidue) break;
    protein += it->second;
  }
  return protein;
}

double ProteinPredictor::MolecularWeight(absl::string_view protein) const {
  if (protein.empty()) return 0.0;
  double mass = kWaterMass;
  for (char aa : protein) {
    auto it = options_.residue_masses.find(aa);
    mass += it == options_.residue_masses.end() ? kUnknownResidueMass : it->second;
  }
  return mass;
}

double ProteinPredictor::MeanHydropathy(absl::string_view protein) const {
  if (protein.empty()) return 0.0;
  double sum = 0.0;
  for (char aa : protein) {
    auto it = options_.hydropathy.find(aa);
    if (it != options_.hydropathy.end()) sum += it->second;
  }
  return sum / static_cast<double>(protein.size());
}

bool ProteinPredictor::HasSignalPeptide(absl::string_view protein) const {
  const SignalPeptideOptions& sp = options_.signal_peptide;
  if (static_cast<int>(protein.size()) < std::max(sp.min_length, sp.window)) return false;

  absl::string_view h_region = protein.substr(1, sp.window - 1);
  if (MeanHydropathy(h_region) < sp.hydrophobicity_threshold) return false;

  int positive = 0;
  int negative = 0;
  for (char aa : protein.substr(0, sp.n_region_length)) {
    if (aa == 'K' || aa == 'R') ++positive;
    if (aa == 'D' || aa == 'E') ++negative;
  }
  return positive >= sp.min_positive_charges && positive > negative;
}

}  // namespace geneflow
