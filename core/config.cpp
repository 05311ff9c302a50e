#include "core/config.h"

#include <cctype>
#include <limits>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "core/errors.h"
#include "core/file_util.h"

namespace geneflow {

namespace {

using nlohmann::json;

absl::Status TypeError(const std::string& key, const char* expected) {
  return absl::InvalidArgumentError(absl::StrCat("Config key '", key, "' must be ", expected));
}

absl::Status ReadInt(const json& obj, const std::string& key, int min_value, int* out) {
  auto it = obj.find(key);
  if (it == obj.end()) return absl::OkStatus();
  if (!it->is_number_integer()) return TypeError(key, "an integer");
  int64_t v = it->get<int64_t>();
  if (v < min_value || v > std::numeric_limits<int>::max()) {
    return absl::InvalidArgumentError(absl::StrCat("Config key '", key, "' must be >= ", min_value));
  }
  *out = static_cast<int>(v);
  return absl::OkStatus();
}

absl::Status ReadDouble(const json& obj, const std::string& key, double* out) {
  auto it = obj.find(key);
  if (it == obj.end()) return absl::OkStatus();
  if (!it->is_number()) return TypeError(key, "a number");
  *out = it->get<double>();
  return absl::OkStatus();
}

absl::Status ReadBool(const json& obj, const std::string& key, bool* out) {
  auto it = obj.find(key);
  if (it == obj.end()) return absl::OkStatus();
  if (!it->is_boolean()) return TypeError(key, "a boolean");
  *out = it->get<bool>();
  return absl::OkStatus();
}

absl::Status ReadSeconds(const json& obj, const std::string& key, absl::Duration* out) {
  auto it = obj.find(key);
  if (it == obj.end()) return absl::OkStatus();
  if (!it->is_number()) return TypeError(key, "a number of seconds");
  double seconds = it->get<double>();
  if (seconds < 0) return absl::InvalidArgumentError(absl::StrCat("Config key '", key, "' must not be negative"));
  *out = absl::Seconds(seconds);
  return absl::OkStatus();
}

// Returns the sub-object at `key`, or nullptr when absent.
absl::StatusOr<const json*> Section(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  if (!it->is_object()) return TypeError(key, "an object");
  return &*it;
}

void WarnUnknownKeys(const json& obj, const std::string& scope, const absl::flat_hash_set<std::string>& known) {
  for (const auto& [key, value] : obj.items()) {
    if (!known.contains(key)) LOG(WARNING) << "Ignoring unknown config key '" << scope << key << "'";
  }
}

absl::Status ReadResidueTable(const json& obj, const std::string& key, ResidueTable* table) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, key));
  if (section == nullptr) return absl::OkStatus();
  for (const auto& [residue, value] : section->items()) {
    if (residue.size() != 1 || !std::isalpha(static_cast<unsigned char>(residue[0]))) {
      return absl::InvalidArgumentError(absl::StrCat("Config key '", key, "' has invalid residue '", residue, "'"));
    }
    if (!value.is_number()) return TypeError(key + "." + residue, "a number");
    (*table)[static_cast<char>(std::toupper(static_cast<unsigned char>(residue[0])))] = value.get<double>();
  }
  return absl::OkStatus();
}

absl::Status ReadGeneticCode(const json& obj, CodonTable* table) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "genetic_code"));
  if (section == nullptr) return absl::OkStatus();
  for (const auto& [codon, value] : section->items()) {
    std::string upper;
    for (char c : codon) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (char& c : upper) {
      if (c == 'U') c = 'T';
    }
    if (upper.size() != 3 || upper.find_first_not_of("ACGT") != std::string::npos) {
      return absl::InvalidArgumentError("Config key 'genetic_code' has invalid codon '" + codon + "'");
    }
    if (!value.is_string() || value.get<std::string>().size() != 1) {
      return TypeError("genetic_code." + codon, "a one-letter residue");
    }
    (*table)[upper] = value.get<std::string>()[0];
  }
  return absl::OkStatus();
}

absl::Status ReadMotifs(const json& obj, std::vector<MotifPattern>* motifs) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "motifs"));
  if (section == nullptr) return absl::OkStatus();
  std::vector<MotifPattern> parsed;
  for (const auto& [name, value] : section->items()) {
    if (!value.is_string()) return TypeError("motifs." + name, "a pattern string");
    std::string pattern = value.get<std::string>();
    if (auto status = ValidateMotifPattern(pattern); !status.ok()) {
      return absl::InvalidArgumentError(absl::StrCat("Motif '", name, "': ", status.message()));
    }
    parsed.push_back({name, pattern});
  }
  *motifs = std::move(parsed);
  return absl::OkStatus();
}

absl::Status ReadSignalPeptide(const json& obj, SignalPeptideOptions* sp) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "signal_peptide"));
  if (section == nullptr) return absl::OkStatus();
  WarnUnknownKeys(*section, "signal_peptide.",
                  {"min_length", "window", "hydrophobicity_threshold", "n_region_length", "min_positive_charges"});
  RETURN_IF_ERROR(ReadInt(*section, "min_length", 1, &sp->min_length));
  RETURN_IF_ERROR(ReadInt(*section, "window", 2, &sp->window));
  RETURN_IF_ERROR(ReadDouble(*section, "hydrophobicity_threshold", &sp->hydrophobicity_threshold));
  RETURN_IF_ERROR(ReadInt(*section, "n_region_length", 1, &sp->n_region_length));
  RETURN_IF_ERROR(ReadInt(*section, "min_positive_charges", 0, &sp->min_positive_charges));
  return absl::OkStatus();
}

absl::Status ReadAlignment(const json& obj, AlignmentScoring* scoring) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "alignment"));
  if (section == nullptr) return absl::OkStatus();
  WarnUnknownKeys(*section, "alignment.",
                  {"match", "transition", "transversion", "gap", "high_homology_threshold",
                   "moderate_homology_threshold"});
  constexpr int kAnyScore = std::numeric_limits<int>::min();
  RETURN_IF_ERROR(ReadInt(*section, "match", kAnyScore, &scoring->match));
  RETURN_IF_ERROR(ReadInt(*section, "transition", kAnyScore, &scoring->transition));
  RETURN_IF_ERROR(ReadInt(*section, "transversion", kAnyScore, &scoring->transversion));
  RETURN_IF_ERROR(ReadInt(*section, "gap", kAnyScore, &scoring->gap));
  RETURN_IF_ERROR(ReadDouble(*section, "high_homology_threshold", &scoring->high_homology_threshold));
  RETURN_IF_ERROR(ReadDouble(*section, "moderate_homology_threshold", &scoring->moderate_homology_threshold));
  if (scoring->moderate_homology_threshold > scoring->high_homology_threshold) {
    return absl::InvalidArgumentError("Moderate homology threshold exceeds the high threshold");
  }
  return absl::OkStatus();
}

absl::Status ReadRetry(const json& obj, RetryPolicy* retry) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "retry"));
  if (section == nullptr) return absl::OkStatus();
  WarnUnknownKeys(*section, "retry.",
                  {"max_attempts", "initial_backoff_seconds", "multiplier", "max_backoff_seconds"});
  RETURN_IF_ERROR(ReadInt(*section, "max_attempts", 1, &retry->max_attempts));
  RETURN_IF_ERROR(ReadSeconds(*section, "initial_backoff_seconds", &retry->initial_backoff));
  RETURN_IF_ERROR(ReadDouble(*section, "multiplier", &retry->multiplier));
  RETURN_IF_ERROR(ReadSeconds(*section, "max_backoff_seconds", &retry->max_backoff));
  if (retry->multiplier < 1.0) return absl::InvalidArgumentError("Config key 'retry.multiplier' must be >= 1");
  return absl::OkStatus();
}

absl::Status ReadModels(const json& obj, PriceTable* prices) {
  ASSIGN_OR_RETURN(const json* section, Section(obj, "models"));
  if (section == nullptr) return absl::OkStatus();
  for (const auto& [name, value] : section->items()) {
    if (!value.is_object()) return TypeError("models." + name, "an object");
    ModelPrice price = prices->models.contains(name) ? prices->models[name] : ModelPrice{};
    RETURN_IF_ERROR(ReadDouble(value, "input", &price.input_per_million));
    RETURN_IF_ERROR(ReadDouble(value, "output", &price.output_per_million));
    if (price.input_per_million < 0 || price.output_per_million < 0) {
      return absl::InvalidArgumentError("Model prices must not be negative: " + name);
    }
    prices->models[name] = price;
  }
  return absl::OkStatus();
}

}  // namespace

GeneflowConfig DefaultConfig() { return GeneflowConfig{}; }

absl::StatusOr<GeneflowConfig> ParseConfig(const std::string& json_text) {
  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded()) return absl::InvalidArgumentError("Config is not valid JSON");
  if (!root.is_object()) return absl::InvalidArgumentError("Config must be a JSON object");

  WarnUnknownKeys(root, "",
                  {"max_sequence_length", "min_orf_length", "max_orfs", "max_orf_bases", "scan_reverse_strand", "motifs",
                   "genetic_code",
                   "residue_masses", "hydropathy", "signal_peptide", "alignment", "hypothesis", "retry", "models",
                   "default_model", "max_session_age_seconds", "history_window", "max_orfs_to_predict"});

  GeneflowConfig config = DefaultConfig();

  int max_len = static_cast<int>(config.analyzer.max_sequence_length);
  RETURN_IF_ERROR(ReadInt(root, "max_sequence_length", 1, &max_len));
  config.analyzer.max_sequence_length = static_cast<size_t>(max_len);
  RETURN_IF_ERROR(ReadInt(root, "min_orf_length", 0, &config.analyzer.min_orf_length));
  int max_orfs = static_cast<int>(config.analyzer.max_orfs);
  RETURN_IF_ERROR(ReadInt(root, "max_orfs", 1, &max_orfs));
  config.analyzer.max_orfs = static_cast<size_t>(max_orfs);
  int max_orf_bases = static_cast<int>(config.analyzer.max_orf_bases);
  RETURN_IF_ERROR(ReadInt(root, "max_orf_bases", 3, &max_orf_bases));
  config.analyzer.max_orf_bases = static_cast<size_t>(max_orf_bases);
  RETURN_IF_ERROR(ReadBool(root, "scan_reverse_strand", &config.analyzer.scan_reverse_strand));
  RETURN_IF_ERROR(ReadMotifs(root, &config.analyzer.motifs));

  RETURN_IF_ERROR(ReadGeneticCode(root, &config.protein.genetic_code));
  RETURN_IF_ERROR(ReadResidueTable(root, "residue_masses", &config.protein.residue_masses));
  RETURN_IF_ERROR(ReadResidueTable(root, "hydropathy", &config.protein.hydropathy));
  RETURN_IF_ERROR(ReadSignalPeptide(root, &config.protein.signal_peptide));

  RETURN_IF_ERROR(ReadAlignment(root, &config.alignment));

  ASSIGN_OR_RETURN(const json* hypothesis, Section(root, "hypothesis"));
  if (hypothesis != nullptr) {
    RETURN_IF_ERROR(ReadDouble(*hypothesis, "min_confidence", &config.hypothesis.min_confidence));
    RETURN_IF_ERROR(ReadDouble(*hypothesis, "hydrophobic_threshold", &config.hypothesis.hydrophobic_threshold));
    if (config.hypothesis.min_confidence < 0.0 || config.hypothesis.min_confidence > 1.0) {
      return absl::InvalidArgumentError("Config key 'hypothesis.min_confidence' must be within [0, 1]");
    }
  }

  RETURN_IF_ERROR(ReadRetry(root, &config.retry));

  RETURN_IF_ERROR(ReadModels(root, &config.prices));
  if (auto it = root.find("default_model"); it != root.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) return TypeError("default_model", "a model name");
    config.default_model = it->get<std::string>();
  }
  if (auto it = config.prices.models.find(config.default_model); it != config.prices.models.end()) {
    config.prices.fallback = it->second;
  } else {
    LOG(WARNING) << "Default model " << config.default_model << " has no price entry; keeping fallback rate";
  }

  RETURN_IF_ERROR(ReadSeconds(root, "max_session_age_seconds", &config.max_session_age));
  if (config.max_session_age <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("Config key 'max_session_age_seconds' must be positive");
  }
  RETURN_IF_ERROR(ReadInt(root, "history_window", 0, &config.history_window));
  RETURN_IF_ERROR(ReadInt(root, "max_orfs_to_predict", 0, &config.max_orfs_to_predict));

  return config;
}

absl::StatusOr<GeneflowConfig> LoadConfig(const std::string& path) {
  if (path.empty()) return DefaultConfig();
  ASSIGN_OR_RETURN(std::string text, ReadFileToString(path));
  auto config = ParseConfig(text);
  if (!config.ok()) {
    return absl::Status(config.status().code(), absl::StrCat(path, ": ", config.status().message()));
  }
  LOG(INFO) << "Loaded configuration from " << path;
  return config;
}

}  // namespace geneflow
