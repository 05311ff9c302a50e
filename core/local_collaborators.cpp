#include "core/local_collaborators.h"

#include <algorithm>
#include <cmath>
#include <filesystem>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "core/errors.h"
#include "core/file_util.h"

namespace geneflow {

namespace {

std::string JoinPath(const std::string& dir, const std::string& file) {
  if (dir.empty()) return file;
  return (std::filesystem::path(dir) / file).string();
}

absl::StatusOr<std::string> WriteJson(const std::string& path, const nlohmann::json& doc) {
  ASSIGN_OR_RETURN(size_t written, WriteStringToFile(path, doc.dump(2, ' ', false,
                                                                    nlohmann::json::error_handler_t::replace)));
  VLOG(1) << "Wrote " << written << " bytes to " << path;
  return path;
}

double GcOf(const std::string& seq, size_t begin, size_t len) {
  if (len == 0) return 0.0;
  auto first = seq.begin() + static_cast<std::ptrdiff_t>(begin);
  auto gc = std::count_if(first, first + static_cast<std::ptrdiff_t>(len), [](char c) { return c == 'G' || c == 'C'; });
  return std::round(1000.0 * static_cast<double>(gc) / static_cast<double>(len)) / 10.0;
}

}  // namespace

absl::StatusOr<LiteratureResult> OfflineLiteratureClient::Search(const std::string& query, int max_results) {
  VLOG(1) << "Offline literature search for '" << query << "' (max " << max_results << ")";
  return LiteratureResult{};
}

nlohmann::json JsonVisualizationWriter::GcProfile(const std::string& sequence, int window, int step) {
  nlohmann::json points = nlohmann::json::array();
  if (sequence.empty() || window <= 0 || step <= 0) return points;
  const size_t w = std::min(sequence.size(), static_cast<size_t>(window));
  for (size_t i = 0; i + w <= sequence.size(); i += static_cast<size_t>(step)) {
    points.push_back({{"position", i + w / 2}, {"gc_percent", GcOf(sequence, i, w)}});
  }
  return points;
}

absl::StatusOr<VisualizationResult> JsonVisualizationWriter::Render(const std::string& run_id,
                                                                   const AnalysisResult& analysis) {
  VisualizationResult result;

  nlohmann::json gc_doc = {{"title", absl::StrCat("GC Content (Window Size: ", kGcWindow, "bp)")},
                           {"sequence_length", analysis.length},
                           {"overall_gc_percent", analysis.gc_percent},
                           {"points", GcProfile(analysis.sequence)}};
  ASSIGN_OR_RETURN(std::string gc_path, WriteJson(JoinPath(output_dir_, run_id + "_gc_profile.json"), gc_doc));
  result.plots.push_back({"gc_profile", gc_path, "json"});

  nlohmann::json orfs = nlohmann::json::array();
  for (const auto& orf : analysis.orfs) {
    orfs.push_back({{"id", orf.Id()},
                    {"start", orf.start},
                    {"end", orf.end},
                    {"frame", orf.frame},
                    {"strand", orf.frame > 0 ? "+" : "-"}});
  }
  nlohmann::json orf_doc = {{"title", "ORF Map"}, {"sequence_length", analysis.length}, {"orfs", orfs}};
  ASSIGN_OR_RETURN(std::string orf_path, WriteJson(JoinPath(output_dir_, run_id + "_orf_map.json"), orf_doc));
  result.plots.push_back({"orf_map", orf_path, "json"});

  return result;
}

absl::StatusOr<ReportInfo> JsonReportWriter::Build(const std::string& run_id, const nlohmann::json& aggregate) {
  const std::string path = JoinPath(output_dir_, run_id + "_report.json");
  nlohmann::json doc = {{"title", "GeneFlow Analysis Report"}, {"run_id", run_id}, {"results", aggregate}};
  ASSIGN_OR_RETURN(std::string written_path, WriteJson(path, doc));

  std::error_code ec;
  auto size = std::filesystem::file_size(written_path, ec);
  if (ec) return absl::InternalError("Could not stat report " + written_path + ": " + ec.message());

  ReportInfo info;
  info.report_path = written_path;
  info.page_count = 1;
  info.file_size_bytes = static_cast<int64_t>(size);
  LOG(INFO) << "Report written to " << written_path;
  return info;
}

}  // namespace geneflow
