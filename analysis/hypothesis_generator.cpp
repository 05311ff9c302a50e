#include "analysis/hypothesis_generator.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace geneflow {

void to_json(nlohmann::json& j, const Hypothesis& hypothesis) {
  j = nlohmann::json{{"hypothesis", hypothesis.statement},
                     {"confidence", hypothesis.confidence},
                     {"evidence", hypothesis.evidence},
                     {"suggested_experiments", hypothesis.suggested_experiments}};
}

std::vector<Hypothesis> HypothesisGenerator::Generate(const AnalysisResult& analysis,
                                                      const std::vector<ProteinProfile>& proteins,
                                                      const std::optional<ComparisonResult>& comparison) const {
  std::vector<Hypothesis> hypotheses;

  std::vector<std::string> promoters;
  for (const auto& hit : analysis.motifs) {
    if (hit.name == "TATA_box" || hit.name == "CAAT_box") {
      promoters.push_back(absl::StrCat(hit.name, "@", hit.position));
    }
  }
  if (!promoters.empty()) {
    hypotheses.push_back({"This sequence contains transcriptional regulatory elements that may control gene expression",
                          0.85, absl::StrCat("Promoter elements: ", absl::StrJoin(promoters, ", ")),
                          {"Promoter activity assay", "ChIP-seq analysis", "Mutagenesis study"}});
  }

  std::vector<std::string> secreted;
  for (const auto& protein : proteins) {
    if (protein.signal_peptide) {
      secreted.push_back(absl::StrCat(protein.orf_id, " (signal peptide)"));
    } else if (protein.hydrophobicity >= options_.hydrophobic_threshold) {
      secreted.push_back(absl::StrCat(protein.orf_id, " (hydropathy ", protein.hydrophobicity, ")"));
    }
  }
  if (!secreted.empty()) {
    hypotheses.push_back({"The encoded protein may be secreted or membrane-associated", 0.78,
                          absl::StrCat("N-terminal signal or hydrophobic protein: ", absl::StrJoin(secreted, ", ")),
                          {"Protein localization studies", "Western blot analysis", "Immunofluorescence"}});
  }

  if (!analysis.orfs.empty()) {
    auto longest = std::max_element(analysis.orfs.begin(), analysis.orfs.end(),
                                    [](const Orf& a, const Orf& b) { return a.length < b.length; });
    hypotheses.push_back({"This sequence encodes a functional protein with potential biological activity", 0.75,
                          absl::StrCat(analysis.orfs.size(), " open reading frame(s), longest ", longest->Id(), " (",
                                       longest->length, " nt)"),
                          {"Protein expression and purification", "Functional assays", "Structural analysis"}});
  }

  if (comparison.has_value() && comparison->homology == "high homology") {
    hypotheses.push_back({"The query is likely homologous to the reference and may share its function", 0.7,
                          absl::StrCat("Similarity ", comparison->similarity_percent, "%, identity ",
                                       comparison->identity_percent, "%"),
                          {"Phylogenetic analysis", "Complementation assay", "Conserved domain search"}});
  }

  if (hypotheses.empty()) {
    hypotheses.push_back({"This sequence represents a genomic region requiring further characterization", 0.60,
                          absl::StrCat(analysis.length, " nt, GC ", analysis.gc_percent,
                                       "%; no promoter elements or open reading frames detected"),
                          {"RNA-seq analysis", "Conservation analysis", "Database homology searches"}});
  }

  hypotheses.erase(std::remove_if(hypotheses.begin(), hypotheses.end(),
                                  [this](const Hypothesis& h) { return h.confidence < options_.min_confidence; }),
                   hypotheses.end());
  return hypotheses;
}

}  // namespace geneflow
