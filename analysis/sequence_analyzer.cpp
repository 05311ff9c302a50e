#include "analysis/sequence_analyzer.h"

#include <algorithm>
#include <cmath>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

#include "analysis/genetic_code.h"
#include "core/errors.h"

namespace geneflow {

namespace {

constexpr uint8_t kA = 1;
constexpr uint8_t kC = 2;
constexpr uint8_t kG = 4;
constexpr uint8_t kT = 8;
constexpr uint8_t kAny = kA | kC | kG | kT;

uint8_t BaseMask(char base) {
  switch (base) {
    case 'A': return kA;
    case 'C': return kC;
    case 'G': return kG;
    case 'T': return kT;
    case 'U': return kT;
    default: return 0;
  }
}

uint8_t IupacMask(char code) {
  switch (code) {
    case 'R': return kA | kG;
    case 'Y': return kC | kT;
    case 'K': return kG | kT;
    case 'M': return kA | kC;
    case 'S': return kC | kG;
    case 'W': return kA | kT;
    case 'B': return kC | kG | kT;
    case 'D': return kA | kG | kT;
    case 'H': return kA | kC | kT;
    case 'V': return kA | kC | kG;
    case 'N': return kAny;
    default: return BaseMask(code);
  }
}

absl::StatusOr<std::vector<uint8_t>> CompileMotif(absl::string_view pattern) {
  std::vector<uint8_t> masks;
  std::string upper = absl::AsciiStrToUpper(pattern);
  for (size_t i = 0; i < upper.size(); ++i) {
    if (upper[i] == '[') {
      size_t close = upper.find(']', i);
      if (close == std::string::npos) {
        return absl::InvalidArgumentError(absl::StrCat("Unterminated class in motif pattern: ", pattern));
      }
      uint8_t mask = 0;
      for (size_t k = i + 1; k < close; ++k) mask |= IupacMask(upper[k]);
      if (mask == 0) return absl::InvalidArgumentError(absl::StrCat("Empty class in motif pattern: ", pattern));
      masks.push_back(mask);
      i = close;
      continue;
    }
    uint8_t mask = IupacMask(upper[i]);
    if (mask == 0) {
      return absl::InvalidArgumentError(absl::StrCat("Invalid character '", std::string(1, upper[i]),
                                                     "' in motif pattern: ", pattern));
    }
    masks.push_back(mask);
  }
  if (masks.empty()) return absl::InvalidArgumentError("Empty motif pattern");
  return masks;
}

bool MatchesAt(absl::string_view dna, size_t pos, const std::vector<uint8_t>& masks) {
  for (size_t k = 0; k < masks.size(); ++k) {
    if (masks[k] == kAny) continue;
    uint8_t base = BaseMask(dna[pos + k]);
    if ((base & masks[k]) == 0) return false;
  }
  return true;
}

bool IsNucleotide(char c) {
  return c == 'A' || c == 'T' || c == 'C' || c == 'G' || c == 'U' || c == 'N';
}

}  // namespace

std::vector<MotifPattern> DefaultMotifs() {
  return {
      {"TATA_box", "TATAWA"},
      {"CAAT_box", "CAAT"},
      {"PolyA_signal", "AATAAA"},
      {"Kozak_consensus", "RCCATGG"},
  };
}

absl::Status ValidateMotifPattern(absl::string_view pattern) { return CompileMotif(pattern).status(); }

std::string SequenceTypeName(SequenceType type) { return type == SequenceType::kRna ? "RNA" : "DNA"; }

std::string Orf::Id() const { return absl::StrCat("ORF_", start, "_", end); }

void to_json(nlohmann::json& j, const Orf& orf) {
  j = nlohmann::json{{"start", orf.start},   {"end", orf.end},     {"sequence", orf.sequence},
                     {"length", orf.length}, {"frame", orf.frame}, {"id", orf.Id()}};
}

void to_json(nlohmann::json& j, const MotifHit& hit) {
  j = nlohmann::json{{"name", hit.name}, {"position", hit.position}, {"match", hit.match}};
}

void to_json(nlohmann::json& j, const AnalysisResult& result) {
  j = nlohmann::json{{"valid", result.valid},
                     {"sequence_type", SequenceTypeName(result.type)},
                     {"length", result.length},
                     {"gc_percent", result.gc_percent},
                     {"orfs", result.orfs},
                     {"motifs", result.motifs}};
  if (result.orfs_truncated) j["orfs_truncated"] = true;
}

SequenceAnalyzer::SequenceAnalyzer(AnalyzerOptions options) : options_(std::move(options)) {
  for (const auto& motif : options_.motifs) {
    auto masks_or = CompileMotif(motif.pattern);
    if (!masks_or.ok()) {
      LOG(WARNING) << "Skipping motif " << motif.name << ": " << masks_or.status().message();
      continue;
    }
    compiled_motifs_.push_back({motif.name, std::move(*masks_or)});
  }
}

std::string SequenceAnalyzer::Normalize(absl::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (absl::string_view line : absl::StrSplit(raw, '\n')) {
    absl::string_view stripped = absl::StripLeadingAsciiWhitespace(line);
    if (!stripped.empty() && stripped.front() == '>') continue;
    for (char c : line) {
      if (absl::ascii_isspace(static_cast<unsigned char>(c)) || absl::ascii_isdigit(static_cast<unsigned char>(c))) {
        continue;
      }
      cleaned += absl::ascii_toupper(static_cast<unsigned char>(c));
    }
  }
  return cleaned;
}

absl::Status SequenceAnalyzer::Validate(absl::string_view cleaned) const {
  if (cleaned.empty()) return InvalidSequenceError("Empty sequence");
  if (cleaned.size() > options_.max_sequence_length) {
    return InvalidSequenceError(absl::StrCat("Sequence length ", cleaned.size(), " exceeds the maximum of ",
                                             options_.max_sequence_length));
  }
  std::string invalid;
  for (char c : cleaned) {
    if (!IsNucleotide(c)) invalid += c;
  }
  if (!invalid.empty()) {
    return InvalidSequenceError(
        absl::StrCat("Invalid nucleotide characters: ", invalid.substr(0, 10), invalid.size() > 10 ? "..." : ""));
  }
  return absl::OkStatus();
}

double SequenceAnalyzer::GcPercent(absl::string_view seq) {
  if (seq.empty()) return 0.0;
  size_t gc = std::count_if(seq.begin(), seq.end(), [](char c) { return c == 'G' || c == 'C'; });
  double percent = 100.0 * static_cast<double>(gc) / static_cast<double>(seq.size());
  return std::round(percent * 10.0) / 10.0;
}

void SequenceAnalyzer::ScanForwardOrfs(absl::string_view dna, int min_length, OrfBudget* budget,
                                       std::vector<Orf>* out) {
  const size_t n = dna.size();
  if (n < 3) return;
  // next_stop[i] is the first in-frame stop codon at or after i, or n.
  std::vector<size_t> next_stop(n - 2, n);
  for (size_t i = n - 2; i-- > 0;) {
    if (IsStopCodon(dna.substr(i, 3))) {
      next_stop[i] = i;
    } else if (i + 3 < n - 2) {
      next_stop[i] = next_stop[i + 3];
    }
  }

  for (size_t i = 0; i + 3 <= n; ++i) {
    if (!IsStartCodon(dna.substr(i, 3))) continue;
    if (i + 3 >= n - 2) break;
    const size_t stop = next_stop[i + 3];
    if (stop == n) continue;
    const size_t length = stop + 3 - i;
    if (static_cast<int>(length) < min_length) continue;
    if (budget->orfs_left == 0 || budget->bases_left < length) {
      budget->exhausted = true;
      return;
    }
    --budget->orfs_left;
    budget->bases_left -= length;

    Orf orf;
    orf.start = static_cast<int>(i);
    orf.end = static_cast<int>(stop + 3);
    orf.length = static_cast<int>(length);
    orf.sequence = std::string(dna.substr(i, length));
    orf.frame = static_cast<int>(i % 3) + 1;
    out->push_back(std::move(orf));
  }
}

std::vector<Orf> SequenceAnalyzer::FindOrfs(absl::string_view dna, bool* truncated) const {
  OrfBudget budget{options_.max_orfs, options_.max_orf_bases, false};
  std::vector<Orf> orfs;
  ScanForwardOrfs(dna, options_.min_orf_length, &budget, &orfs);

  if (options_.scan_reverse_strand && !budget.exhausted) {
    const int n = static_cast<int>(dna.size());
    std::string rc = ReverseComplement(dna);
    std::vector<Orf> reverse;
    ScanForwardOrfs(rc, options_.min_orf_length, &budget, &reverse);
    for (Orf& orf : reverse) {
      int rc_start = orf.start;
      orf.start = n - orf.end;
      orf.end = n - rc_start;
      orf.frame = -orf.frame;
      orfs.push_back(std::move(orf));
    }
    std::sort(orfs.begin(), orfs.end(), [](const Orf& a, const Orf& b) {
      return a.start != b.start ? a.start < b.start : a.frame < b.frame;
    });
  }

  if (budget.exhausted) {
    LOG(WARNING) << "ORF scan stopped after " << orfs.size() << " ORFs (limits: " << options_.max_orfs << " ORFs, "
                 << options_.max_orf_bases << " bases)";
  }
  if (truncated != nullptr) *truncated = budget.exhausted;
  return orfs;
}

std::vector<MotifHit> SequenceAnalyzer::ScanMotifs(absl::string_view dna) const {
  std::vector<MotifHit> hits;
  for (const auto& motif : compiled_motifs_) {
    const size_t len = motif.masks.size();
    size_t pos = 0;
    while (pos + len <= dna.size()) {
      if (MatchesAt(dna, pos, motif.masks)) {
        hits.push_back({motif.name, static_cast<int>(pos), std::string(dna.substr(pos, len))});
        pos += len;
      } else {
        ++pos;
      }
    }
  }
  return hits;
}

absl::StatusOr<AnalysisResult> SequenceAnalyzer::Analyze(absl::string_view raw) const {
  std::string cleaned = Normalize(raw);
  RETURN_IF_ERROR(Validate(cleaned));

  AnalysisResult result;
  result.valid = true;
  bool has_u = cleaned.find('U') != std::string::npos;
  bool has_t = cleaned.find('T') != std::string::npos;
  result.type = (has_u && !has_t) ? SequenceType::kRna : SequenceType::kDna;
  result.length = static_cast<int>(cleaned.size());
  result.gc_percent = GcPercent(cleaned);

  std::string dna = ToDnaAlphabet(cleaned);
  result.orfs = FindOrfs(dna, &result.orfs_truncated);
  result.motifs = ScanMotifs(dna);
  result.sequence = std::move(cleaned);

  VLOG(1) << "Analyzed " << result.length << " nt: GC " << result.gc_percent << "%, " << result.orfs.size()
          << " ORFs, " << result.motifs.size() << " motif hits";
  return result;
}

}  // namespace geneflow
