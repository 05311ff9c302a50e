#include "core/performance_tracker.h"

#include <algorithm>
#include <limits>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "core/errors.h"
#include "core/file_util.h"
#include "core/session.h"

namespace geneflow {

double PriceTable::Cost(const std::string& model, int input_tokens, int output_tokens) const {
  const ModelPrice* price = &fallback;
  auto it = models.find(model);
  if (it != models.end()) price = &it->second;
  return (input_tokens * price->input_per_million + output_tokens * price->output_per_million) / 1e6;
}

PriceTable DefaultPriceTable() {
  PriceTable table;
  table.models["gemini-2.0-flash"] = {0.15, 0.60};
  table.models["gemini-1.5-flash"] = {0.075, 0.30};
  table.models["gemini-1.5-pro"] = {1.25, 5.00};
  table.models["gpt-4o-mini"] = {0.15, 0.60};
  table.fallback = table.models["gpt-4o-mini"];
  return table;
}

void to_json(nlohmann::json& j, const ExecutionRecord& record) {
  j = nlohmann::json{{"stage", record.stage},
                     {"execution_id", record.execution_id},
                     {"start_time", absl::ToUnixMicros(record.start_time)},
                     {"end_time", absl::ToUnixMicros(record.end_time)},
                     {"duration_seconds", absl::ToDoubleSeconds(record.duration())},
                     {"input_tokens", record.input_tokens},
                     {"output_tokens", record.output_tokens},
                     {"total_tokens", record.total_tokens()},
                     {"model", record.model},
                     {"cost", record.cost},
                     {"success", record.success},
                     {"error", record.error},
                     {"tool_calls", record.tool_calls}};
}

absl::StatusOr<ExecutionRecord> ExecutionRecordFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return absl::InvalidArgumentError("Execution record must be an object");
  for (const char* key : {"stage", "execution_id", "model", "error"}) {
    if (!j.contains(key) || !j[key].is_string()) {
      return absl::InvalidArgumentError(absl::StrCat("Execution record field '", key, "' must be a string"));
    }
  }
  for (const char* key : {"start_time", "end_time", "input_tokens", "output_tokens"}) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
      return absl::InvalidArgumentError(absl::StrCat("Execution record field '", key, "' must be an integer"));
    }
  }
  if (!j.contains("cost") || !j["cost"].is_number()) {
    return absl::InvalidArgumentError("Execution record field 'cost' must be a number");
  }
  if (!j.contains("success") || !j["success"].is_boolean()) {
    return absl::InvalidArgumentError("Execution record field 'success' must be a boolean");
  }

  ExecutionRecord record;
  record.stage = j["stage"].get<std::string>();
  record.execution_id = j["execution_id"].get<std::string>();
  record.start_time = absl::FromUnixMicros(j["start_time"].get<int64_t>());
  record.end_time = absl::FromUnixMicros(j["end_time"].get<int64_t>());
  record.input_tokens = j["input_tokens"].get<int>();
  record.output_tokens = j["output_tokens"].get<int>();
  record.model = j["model"].get<std::string>();
  record.cost = j["cost"].get<double>();
  record.success = j["success"].get<bool>();
  record.error = j["error"].get<std::string>();
  if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
    for (const auto& call : j["tool_calls"]) {
      if (call.is_string()) record.tool_calls.push_back(call.get<std::string>());
    }
  }
  return record;
}

void to_json(nlohmann::json& j, const StageSummary& stage) {
  j = nlohmann::json{{"count", stage.count},
                     {"successful", stage.successful},
                     {"failed", stage.failed},
                     {"total_tokens", stage.total_tokens},
                     {"total_cost", stage.total_cost},
                     {"avg_duration_seconds", stage.avg_duration_seconds}};
}

void to_json(nlohmann::json& j, const PerformanceSummary& summary) {
  j = nlohmann::json{{"total_executions", summary.total_executions},
                     {"successful", summary.successful},
                     {"failed", summary.failed},
                     {"success_rate", summary.success_rate},
                     {"avg_duration_seconds", summary.avg_duration_seconds},
                     {"min_duration_seconds", summary.min_duration_seconds},
                     {"max_duration_seconds", summary.max_duration_seconds},
                     {"total_tokens", summary.total_tokens},
                     {"input_tokens", summary.input_tokens},
                     {"output_tokens", summary.output_tokens},
                     {"total_cost", summary.total_cost},
                     {"by_stage", summary.by_stage}};
}

PerformanceSummary Summarize(const std::vector<ExecutionRecord>& records, absl::Time cutoff) {
  PerformanceSummary summary;
  double total_seconds = 0.0;
  double min_seconds = std::numeric_limits<double>::max();
  double max_seconds = 0.0;
  std::map<std::string, double> stage_seconds;

  for (const auto& r : records) {
    if (r.start_time < cutoff) continue;
    const double seconds = absl::ToDoubleSeconds(r.duration());
    ++summary.total_executions;
    if (r.success) {
      ++summary.successful;
    } else {
      ++summary.failed;
    }
    total_seconds += seconds;
    min_seconds = std::min(min_seconds, seconds);
    max_seconds = std::max(max_seconds, seconds);
    summary.input_tokens += r.input_tokens;
    summary.output_tokens += r.output_tokens;
    summary.total_cost += r.cost;

    StageSummary& stage = summary.by_stage[r.stage];
    ++stage.count;
    if (r.success) {
      ++stage.successful;
    } else {
      ++stage.failed;
    }
    stage.total_tokens += r.total_tokens();
    stage.total_cost += r.cost;
    stage_seconds[r.stage] += seconds;
  }

  summary.total_tokens = summary.input_tokens + summary.output_tokens;
  if (summary.total_executions > 0) {
    summary.success_rate = static_cast<double>(summary.successful) / summary.total_executions;
    summary.avg_duration_seconds = total_seconds / summary.total_executions;
    summary.min_duration_seconds = min_seconds;
    summary.max_duration_seconds = max_seconds;
  }
  for (auto& [name, stage] : summary.by_stage) {
    stage.avg_duration_seconds = stage_seconds[name] / stage.count;
  }
  return summary;
}

PerformanceTracker::PerformanceTracker(Database* db, PriceTable prices, std::function<absl::Time()> clock)
    : db_(db), prices_(std::move(prices)), clock_(std::move(clock)) {}

absl::Time PerformanceTracker::Now() const { return TruncateToMicros(clock_ ? clock_() : absl::Now()); }

std::string PerformanceTracker::StartExecution(const std::string& stage) {
  std::string id = absl::StrCat(stage, "_", NewSessionId());
  absl::MutexLock lock(&mu_);
  pending_.insert(id);
  return id;
}

absl::StatusOr<ExecutionRecord> PerformanceTracker::EndExecution(const std::string& stage,
                                                                 const std::string& execution_id,
                                                                 absl::Time start_time, int input_tokens,
                                                                 int output_tokens, const std::string& model,
                                                                 bool success, const std::string& error,
                                                                 const std::vector<std::string>& tool_calls) {
  ExecutionRecord record;
  record.stage = stage;
  record.execution_id = execution_id;
  record.start_time = TruncateToMicros(start_time);
  record.end_time = std::max(Now(), record.start_time);
  record.input_tokens = std::max(0, input_tokens);
  record.output_tokens = std::max(0, output_tokens);
  record.model = model;
  record.cost = prices_.Cost(model, record.input_tokens, record.output_tokens);
  record.success = success;
  record.error = error;
  record.tool_calls = tool_calls;

  absl::MutexLock lock(&mu_);
  if (finalized_.contains(execution_id)) {
    return absl::FailedPreconditionError("Execution already finalized: " + execution_id);
  }
  if (!pending_.contains(execution_id)) {
    return absl::NotFoundError("Unknown execution: " + execution_id);
  }

  if (db_ != nullptr) {
    nlohmann::json j = record;
    Database::ExecutionRow row;
    row.id = execution_id;
    row.stage = stage;
    row.record = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    row.start_micros = absl::ToUnixMicros(record.start_time);
    RETURN_IF_ERROR(db_->InsertExecution(row));
  }

  pending_.erase(execution_id);
  finalized_.insert(execution_id);
  records_.push_back(record);
  VLOG(1) << "Execution " << execution_id << " finished in " << record.duration()
          << (success ? "" : " with error: " + error);
  return record;
}

std::vector<ExecutionRecord> PerformanceTracker::Records() {
  absl::MutexLock lock(&mu_);
  return records_;
}

PerformanceSummary PerformanceTracker::Summary(std::optional<absl::Duration> window) {
  absl::Time cutoff = window ? Now() - *window : absl::InfinitePast();
  return Summarize(Records(), cutoff);
}

absl::StatusOr<PerformanceSummary> PerformanceTracker::ReplaySummary(std::optional<absl::Duration> window) {
  if (db_ == nullptr) return absl::FailedPreconditionError("No database attached to the tracker");
  absl::Time cutoff = window ? Now() - *window : absl::InfinitePast();
  int64_t since = window ? absl::ToUnixMicros(cutoff) : 0;
  ASSIGN_OR_RETURN(auto rows, db_->GetExecutions(since));

  std::vector<ExecutionRecord> records;
  records.reserve(rows.size());
  for (const auto& row : rows) {
    auto j = nlohmann::json::parse(row.record, nullptr, false);
    if (j.is_discarded()) {
      LOG(WARNING) << "Skipping execution " << row.id << ": record is not valid JSON";
      continue;
    }
    auto record_or = ExecutionRecordFromJson(j);
    if (!record_or.ok()) {
      LOG(WARNING) << "Skipping execution " << row.id << ": " << record_or.status();
      continue;
    }
    records.push_back(std::move(*record_or));
  }
  return Summarize(records, cutoff);
}

absl::StatusOr<nlohmann::json> PerformanceTracker::Export(const std::string& path) {
  std::vector<ExecutionRecord> records = Records();
  nlohmann::json doc = {{"exported_at", absl::FormatTime(absl::RFC3339_full, Now(), absl::UTCTimeZone())},
                        {"summary", Summarize(records)},
                        {"executions", records}};
  const std::string payload = doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  if (!path.empty()) {
    ASSIGN_OR_RETURN(size_t written, WriteStringToFile(path, payload));
    LOG(INFO) << "Exported " << records.size() << " execution records (" << written << " bytes) to " << path;
  }
  if (db_ != nullptr) {
    RETURN_IF_ERROR(db_->RecordMetricExport(path, payload));
  }
  return doc;
}

}  // namespace geneflow
