#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

#include <nlohmann/json.hpp>

#include "core/config.h"
#include "core/constants.h"
#include "core/database.h"
#include "core/file_util.h"
#include "core/http_client.h"
#include "core/local_collaborators.h"
#include "core/openai_completion_client.h"
#include "core/performance_tracker.h"
#include "core/pipeline_orchestrator.h"
#include "core/request_dispatcher.h"
#include "core/request_router.h"
#include "core/session_store.h"

ABSL_FLAG(std::string, db, "geneflow.db", "Path to SQLite database");
ABSL_FLAG(std::string, config, "", "Path to a JSON configuration file layered over the defaults");
ABSL_FLAG(std::string, log, "", "Log file path");
ABSL_FLAG(std::string, session, "", "Session to resume; a new one is created when empty or unknown");
ABSL_FLAG(std::string, owner, "anonymous", "Owner recorded on newly created sessions");
ABSL_FLAG(std::string, model, "", "Model name (overrides OPENAI_MODEL env var and the configured default)");
ABSL_FLAG(std::string, openai_api_key, "", "OpenAI API key (overrides OPENAI_API_KEY env var)");
ABSL_FLAG(std::string, openai_base_url, "", "OpenAI Base URL (overrides OPENAI_BASE_URL env var)");
ABSL_FLAG(std::string, output_dir, "geneflow_out", "Directory for plot data and reports");
ABSL_FLAG(std::string, batch, "",
          "Route every line of this file and exit. Lines are JSON objects {message, session_id, owner_id, "
          "compare_to} or plain messages.");
ABSL_FLAG(int, workers, geneflow::RequestDispatcher::kDefaultWorkers, "Worker threads for batch mode");

namespace {

constexpr char kHelpText[] =
    "GeneFlow - conversational DNA/RNA analysis\n\n"
    "Usage: geneflow [options]\n\n"
    "Messages containing a nucleotide run of 20 or more bases are analyzed;\n"
    "anything else is answered by the configured language model.\n\n"
    "Slash commands:\n"
    "  /stats            Session statistics\n"
    "  /metrics [secs]   Performance summary, optionally over the last N seconds\n"
    "  /export [path]    Export execution records and summary\n"
    "  /sweep            Remove expired sessions\n"
    "  /new              Start a new session\n"
    "  /quit             Exit\n\n"
    "Use --helpfull to see all available command-line flags.\n";

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  // Send can be called from the dispatcher's worker threads.
  std::mutex mu_;
  std::ofstream stream_;
};

std::string FlagOrEnv(const std::string& flag_value, const char* env_name, const std::string& fallback = "") {
  if (!flag_value.empty()) return flag_value;
  const char* env = std::getenv(env_name);
  return env != nullptr ? std::string(env) : fallback;
}

void HandleStatus(const absl::Status& status, const std::string& context) {
  if (status.ok()) return;
  std::cerr << context << ": " << status.message() << std::endl;
  LOG(ERROR) << context << ": " << status;
}

std::string Dump(const nlohmann::json& j) { return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace); }

int RunBatch(geneflow::RequestRouter* router, const std::string& path, const std::string& session_id,
             const std::string& owner_id) {
  auto content = geneflow::ReadFileToString(path);
  if (!content.ok()) {
    HandleStatus(content.status(), "Batch Error");
    return 1;
  }
  auto requests = geneflow::ParseBatchRequests(*content, session_id, owner_id);
  if (!requests.ok()) {
    HandleStatus(requests.status(), absl::StrCat("Batch Error in ", path));
    return 1;
  }
  geneflow::RequestDispatcher dispatcher(router, absl::GetFlag(FLAGS_workers));
  auto cancellation = std::make_shared<geneflow::CancellationRequest>();
  auto results = dispatcher.Dispatch(*requests, cancellation);

  int failures = 0;
  for (const auto& result : results) {
    if (!result.ok()) {
      ++failures;
      std::cout << nlohmann::json{{"success", false}, {"error", std::string(result.status().message())}}.dump()
                << std::endl;
      continue;
    }
    if (!result->success) ++failures;
    std::cout << result->ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  LOG(INFO) << "Batch finished: " << results.size() << " requests, " << failures << " failed";
  return failures == 0 ? 0 : 2;
}

// Returns false when the loop should stop.
bool HandleCommand(const std::string& input, std::string* session_id, const std::string& owner_id,
                   geneflow::SessionStore* sessions, geneflow::PerformanceTracker* tracker) {
  std::vector<std::string> parts = absl::StrSplit(input, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  const std::string& command = parts[0];
  const std::string arg = parts.size() > 1 ? parts[1] : "";

  if (command == "/quit" || command == "/exit") return false;
  if (command == "/help") {
    std::cout << kHelpText;
  } else if (command == "/stats") {
    std::cout << Dump(sessions->Stats()) << std::endl;
  } else if (command == "/metrics") {
    std::optional<absl::Duration> window;
    int seconds = 0;
    if (!arg.empty()) {
      if (!absl::SimpleAtoi(arg, &seconds) || seconds <= 0) {
        std::cout << "Usage: /metrics [seconds]" << std::endl;
        return true;
      }
      window = absl::Seconds(seconds);
    }
    std::cout << Dump(tracker->Summary(window)) << std::endl;
  } else if (command == "/export") {
    auto exported = tracker->Export(arg);
    if (!exported.ok()) {
      HandleStatus(exported.status(), "Export Error");
    } else if (arg.empty()) {
      std::cout << "Exported " << (*exported)["executions"].size() << " records to the database." << std::endl;
    } else {
      std::cout << "Exported " << (*exported)["executions"].size() << " records to " << arg << std::endl;
    }
  } else if (command == "/sweep") {
    std::vector<std::string> removed = sessions->SweepExpired();
    std::cout << "Removed " << removed.size() << " expired session(s)." << std::endl;
  } else if (command == "/new") {
    auto session = sessions->CreateSession(owner_id);
    if (!session.ok()) {
      HandleStatus(session.status(), "Session Error");
    } else {
      *session_id = session->id;
      std::cout << "Session: " << *session_id << std::endl;
    }
  } else {
    std::cout << "Unknown command: " << command << ". Type /help for slash commands." << std::endl;
  }
  return true;
}

int RunInteractive(geneflow::RequestRouter* router, geneflow::SessionStore* sessions,
                   geneflow::PerformanceTracker* tracker, std::string session_id, const std::string& owner_id) {
  auto session = sessions->GetOrCreate(session_id, owner_id);
  if (!session.ok()) {
    HandleStatus(session.status(), "Session Error");
    return 1;
  }
  session_id = session->id;
  std::cout << "GeneFlow - Session: " << session_id << std::endl;
  std::cout << "Type /help for slash commands." << std::endl;

  std::string line;
  while (true) {
    std::cout << "geneflow> " << std::flush;
    if (!std::getline(std::cin, line)) break;
    std::string input(absl::StripAsciiWhitespace(line));
    if (input.empty()) continue;

    if (input.front() == '/') {
      if (!HandleCommand(input, &session_id, owner_id, sessions, tracker)) break;
      continue;
    }

    auto routed = router->Route(input, session_id, owner_id);
    if (!routed.ok()) {
      HandleStatus(routed.status(), "Session Error");
      continue;
    }
    // A session swept between requests comes back under a new id.
    if (routed->session_id != session_id) {
      session_id = routed->session_id;
      std::cout << "Session: " << session_id << std::endl;
    }
    std::cout << routed->response << "\n" << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(kHelpText);
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<FileLogSink> log_sink;
  if (!log_path.empty()) {
    log_sink = std::make_unique<FileLogSink>(log_path);
    absl::AddLogSink(log_sink.get());
  }
  LOG(INFO) << "Logging initialized and sink added.";

  auto config_or = geneflow::LoadConfig(absl::GetFlag(FLAGS_config));
  if (!config_or.ok()) {
    HandleStatus(config_or.status(), "Config Error");
    return 1;
  }
  geneflow::GeneflowConfig config = std::move(*config_or);

  const std::string api_key = FlagOrEnv(absl::GetFlag(FLAGS_openai_api_key), "OPENAI_API_KEY");
  const std::string base_url =
      FlagOrEnv(absl::GetFlag(FLAGS_openai_base_url), "OPENAI_BASE_URL", geneflow::kOpenAIBaseUrl);
  const std::string model = FlagOrEnv(absl::GetFlag(FLAGS_model), "OPENAI_MODEL", config.default_model);
  const std::string owner_id = absl::GetFlag(FLAGS_owner);

  geneflow::Database db;
  auto status = db.Init(absl::GetFlag(FLAGS_db));
  if (!status.ok()) {
    HandleStatus(status, "Database Error");
    return 1;
  }

  geneflow::SessionStoreOptions store_options;
  store_options.max_session_age = config.max_session_age;
  auto sessions_or = geneflow::SessionStore::Create(&db, store_options);
  if (!sessions_or.ok()) {
    HandleStatus(sessions_or.status(), "Session Store Error");
    return 1;
  }
  auto& sessions = **sessions_or;
  std::vector<std::string> expired = sessions.SweepExpired();
  if (!expired.empty()) LOG(INFO) << "Removed " << expired.size() << " expired sessions at startup";

  geneflow::PerformanceTracker tracker(&db, config.prices);

  geneflow::HttpClient http_client;
  std::unique_ptr<geneflow::OpenAiCompletionClient> completion;
  if (!api_key.empty()) {
    completion = std::make_unique<geneflow::OpenAiCompletionClient>(&http_client, api_key, model, base_url);
  } else {
    LOG(WARNING) << "No OpenAI API key configured; conversational messages will fail and analyses carry no narrative.";
  }

  const std::string output_dir = absl::GetFlag(FLAGS_output_dir);
  geneflow::OfflineLiteratureClient literature;
  geneflow::JsonVisualizationWriter visualization(output_dir);
  geneflow::JsonReportWriter reports(output_dir);

  auto pipeline_or = geneflow::PipelineOrchestrator::Builder(&tracker)
                         .WithConfig(config)
                         .WithCompletionClient(completion.get())
                         .WithLiteratureClient(&literature)
                         .WithVisualizationClient(&visualization)
                         .WithReportClient(&reports)
                         .Build();
  if (!pipeline_or.ok()) {
    LOG(ERROR) << "Failed to create pipeline: " << pipeline_or.status().message();
    return 1;
  }
  auto pipeline = std::move(*pipeline_or);

  geneflow::RouterOptions router_options;
  router_options.history_window = config.history_window;
  router_options.retry = config.retry;
  geneflow::RequestRouter router(&sessions, pipeline.get(), completion.get(), &tracker, router_options);

  const std::string batch_path = absl::GetFlag(FLAGS_batch);
  int exit_code = batch_path.empty()
                      ? RunInteractive(&router, &sessions, &tracker, absl::GetFlag(FLAGS_session), owner_id)
                      : RunBatch(&router, batch_path, absl::GetFlag(FLAGS_session), owner_id);

  auto exported = tracker.Export();
  if (!exported.ok()) LOG(WARNING) << "Could not export metrics at shutdown: " << exported.status();

  if (log_sink) absl::RemoveLogSink(log_sink.get());
  return exit_code;
}
