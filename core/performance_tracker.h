#ifndef GENEFLOW_CORE_PERFORMANCE_TRACKER_H_
#define GENEFLOW_CORE_PERFORMANCE_TRACKER_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

#include "core/database.h"

namespace geneflow {

// USD per million tokens.
struct ModelPrice {
  double input_per_million = 0.0;
  double output_per_million = 0.0;
};

struct PriceTable {
  absl::flat_hash_map<std::string, ModelPrice> models;
  // Used for models missing from `models`.
  ModelPrice fallback;

  double Cost(const std::string& model, int input_tokens, int output_tokens) const;
};

PriceTable DefaultPriceTable();

struct ExecutionRecord {
  std::string stage;
  std::string execution_id;
  absl::Time start_time;
  absl::Time end_time;
  int input_tokens = 0;
  int output_tokens = 0;
  std::string model;
  double cost = 0.0;
  bool success = true;
  std::string error;
  std::vector<std::string> tool_calls;

  absl::Duration duration() const { return end_time - start_time; }
  int total_tokens() const { return input_tokens + output_tokens; }
};

void to_json(nlohmann::json& j, const ExecutionRecord& record);
absl::StatusOr<ExecutionRecord> ExecutionRecordFromJson(const nlohmann::json& j);

struct StageSummary {
  int count = 0;
  int successful = 0;
  int failed = 0;
  int total_tokens = 0;
  double total_cost = 0.0;
  double avg_duration_seconds = 0.0;
};

struct PerformanceSummary {
  int total_executions = 0;
  int successful = 0;
  int failed = 0;
  double success_rate = 0.0;
  double avg_duration_seconds = 0.0;
  double min_duration_seconds = 0.0;
  double max_duration_seconds = 0.0;
  int total_tokens = 0;
  int input_tokens = 0;
  int output_tokens = 0;
  double total_cost = 0.0;
  std::map<std::string, StageSummary> by_stage;
};

void to_json(nlohmann::json& j, const StageSummary& stage);
void to_json(nlohmann::json& j, const PerformanceSummary& summary);

// Aggregates the records whose start_time is at or after `cutoff`. A pure
// function of its input, so any two equal record sets summarize identically.
PerformanceSummary Summarize(const std::vector<ExecutionRecord>& records,
                             absl::Time cutoff = absl::InfinitePast());

// Thread-safe accounting of stage executions. Every finalized record is
// persisted to the `executions` table when a database is attached.
class PerformanceTracker {
 public:
  // `db` may be null for an in-memory tracker.
  PerformanceTracker(Database* db, PriceTable prices, std::function<absl::Time()> clock = nullptr);

  // Registers a pending execution and returns its id.
  std::string StartExecution(const std::string& stage);

  // Finalizes a pending execution. NotFound for ids never started,
  // FailedPrecondition for ids already finalized.
  absl::StatusOr<ExecutionRecord> EndExecution(const std::string& stage, const std::string& execution_id,
                                               absl::Time start_time, int input_tokens, int output_tokens,
                                               const std::string& model, bool success, const std::string& error = "",
                                               const std::vector<std::string>& tool_calls = {});

  PerformanceSummary Summary(std::optional<absl::Duration> window = std::nullopt);

  // Aggregates records read back from the database.
  absl::StatusOr<PerformanceSummary> ReplaySummary(std::optional<absl::Duration> window = std::nullopt);

  // Serializes raw records and the summary. The document is recorded in the
  // metric_exports table and, when `path` is non-empty, written to that file.
  absl::StatusOr<nlohmann::json> Export(const std::string& path = "");

  std::vector<ExecutionRecord> Records();

  const PriceTable& prices() const { return prices_; }

 private:
  absl::Time Now() const;

  Database* db_;
  PriceTable prices_;
  std::function<absl::Time()> clock_;

  absl::Mutex mu_;
  absl::flat_hash_set<std::string> pending_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<std::string> finalized_ ABSL_GUARDED_BY(mu_);
  std::vector<ExecutionRecord> records_ ABSL_GUARDED_BY(mu_);
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_PERFORMANCE_TRACKER_H_
