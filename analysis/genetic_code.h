#ifndef GENEFLOW_ANALYSIS_GENETIC_CODE_H_
#define GENEFLOW_ANALYSIS_GENETIC_CODE_H_

#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"

namespace geneflow {

// Codon (DNA alphabet, uppercase) -> one-letter residue. Stops map to kStopResidue.
using CodonTable = absl::flat_hash_map<std::string, char>;
// One-letter residue -> scalar (mass in Da, hydropathy index, ...).
using ResidueTable = absl::flat_hash_map<char, double>;

inline constexpr char kStopResidue = '*';
inline constexpr char kUnknownResidue = 'X';
inline constexpr double kWaterMass = 18.01528;
// Average residue mass used for residues missing from the mass table.
inline constexpr double kUnknownResidueMass = 110.0;

// NCBI translation table 1.
const CodonTable& StandardGeneticCode();

// Average (not monoisotopic) residue masses, i.e. free amino acid minus water.
const ResidueTable& AverageResidueMasses();

// Kyte & Doolittle (1982) hydropathy index.
const ResidueTable& KyteDoolittleScale();

bool IsStartCodon(absl::string_view codon);
bool IsStopCodon(absl::string_view codon);

inline char Complement(char base) {
  switch (base) {
    case 'A': return 'T';
    case 'T': return 'A';
    case 'U': return 'A';
    case 'C': return 'G';
    case 'G': return 'C';
    default: return 'N';
  }
}

std::string ReverseComplement(absl::string_view seq);

// Returns a copy with every U replaced by T.
std::string ToDnaAlphabet(absl::string_view seq);

}  // namespace geneflow

#endif  // GENEFLOW_ANALYSIS_GENETIC_CODE_H_
