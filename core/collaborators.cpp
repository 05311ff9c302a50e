#include "core/collaborators.h"

namespace geneflow {

void to_json(nlohmann::json& j, const Paper& paper) {
  j = nlohmann::json{{"id", paper.id},
                     {"title", paper.title},
                     {"authors", paper.authors},
                     {"year", paper.year},
                     {"abstract", paper.abstract_text}};
}

void to_json(nlohmann::json& j, const LiteratureResult& result) {
  j = nlohmann::json{{"total_results", result.total_results}, {"papers", result.papers}};
}

void to_json(nlohmann::json& j, const Plot& plot) {
  j = nlohmann::json{{"name", plot.name}, {"path", plot.path}, {"format", plot.format}};
}

void to_json(nlohmann::json& j, const VisualizationResult& result) { j = nlohmann::json{{"plots", result.plots}}; }

void to_json(nlohmann::json& j, const ReportInfo& info) {
  j = nlohmann::json{{"report_path", info.report_path},
                     {"page_count", info.page_count},
                     {"file_size_bytes", info.file_size_bytes}};
}

}  // namespace geneflow
