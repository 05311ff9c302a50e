#include "analysis/genetic_code.h"

namespace geneflow {

const CodonTable& StandardGeneticCode() {
  static const CodonTable* const kTable = new CodonTable{
      {"ATA", 'I'}, {"ATC", 'I'}, {"ATT", 'I'}, {"ATG", 'M'}, {"ACA", 'T'}, {"ACC", 'T'}, {"ACG", 'T'},
      {"ACT", 'T'}, {"AAC", 'N'}, {"AAT", 'N'}, {"AAA", 'K'}, {"AAG", 'K'}, {"AGC", 'S'}, {"AGT", 'S'},
      {"AGA", 'R'}, {"AGG", 'R'}, {"CTA", 'L'}, {"CTC", 'L'}, {"CTG", 'L'}, {"CTT", 'L'}, {"CCA", 'P'},
      {"CCC", 'P'}, {"CCG", 'P'}, {"CCT", 'P'}, {"CAC", 'H'}, {"CAT", 'H'}, {"CAA", 'Q'}, {"CAG", 'Q'},
      {"CGA", 'R'}, {"CGC", 'R'}, {"CGG", 'R'}, {"CGT", 'R'}, {"GTA", 'V'}, {"GTC", 'V'}, {"GTG", 'V'},
      {"GTT", 'V'}, {"GCA", 'A'}, {"GCC", 'A'}, {"GCG", 'A'}, {"GCT", 'A'}, {"GAC", 'D'}, {"GAT", 'D'},
      {"GAA", 'E'}, {"GAG", 'E'}, {"GGA", 'G'}, {"GGC", 'G'}, {"GGG", 'G'}, {"GGT", 'G'}, {"TCA", 'S'},
      {"TCC", 'S'}, {"TCG", 'S'}, {"TCT", 'S'}, {"TTC", 'F'}, {"TTT", 'F'}, {"TTA", 'L'}, {"TTG", 'L'},
      {"TAC", 'Y'}, {"TAT", 'Y'}, {"TAA", '*'}, {"TAG", '*'}, {"TGC", 'C'}, {"TGT", 'C'}, {"TGA", '*'},
      {"TGG", 'W'},
  };
  return *kTable;
}

const ResidueTable& AverageResidueMasses() {
  static const ResidueTable* const kTable = new ResidueTable{
      {'A', 71.0788},  {'R', 156.1875}, {'N', 114.1038}, {'D', 115.0886}, {'C', 103.1388},
      {'E', 129.1155}, {'Q', 128.1307}, {'G', 57.0519},  {'H', 137.1411}, {'I', 113.1594},
      {'L', 113.1594}, {'K', 128.1741}, {'M', 131.1926}, {'F', 147.1766}, {'P', 97.1167},
      {'S', 87.0782},  {'T', 101.1051}, {'W', 186.2132}, {'Y', 163.1760}, {'V', 99.1326},
  };
  return *kTable;
}

const ResidueTable& KyteDoolittleScale() {
  static const ResidueTable* const kTable = new ResidueTable{
      {'A', 1.8},  {'R', -4.5}, {'N', -3.5}, {'D', -3.5}, {'C', 2.5},  {'Q', -3.5}, {'E', -3.5},
      {'G', -0.4}, {'H', -3.2}, {'I', 4.5},  {'L', 3.8},  {'K', -3.9}, {'M', 1.9},  {'F', 2.8},
      {'P', -1.6}, {'S', -0.8}, {'T', -0.7}, {'W', -0.9}, {'Y', -1.3}, {'V', 4.2},
  };
  return *kTable;
}

bool IsStartCodon(absl::string_view codon) { return codon == "ATG"; }

bool IsStopCodon(absl::string_view codon) { return codon == "TAA" || codon == "TAG" || codon == "TGA"; }

std::string ReverseComplement(absl::string_view seq) {
  std::string rc;
  rc.reserve(seq.size());
  for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
    rc += Complement(*it);
  }
  return rc;
}

std::string ToDnaAlphabet(absl::string_view seq) {
  std::string dna(seq);
  for (char& c : dna) {
    if (c == 'U') c = 'T';
  }
  return dna;
}

}  // namespace geneflow
