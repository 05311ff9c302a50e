#include "core/request_dispatcher.h"

#include <chrono>
#include <thread>

#include "gtest/gtest.h"

#include "core/errors.h"
#include "core/local_collaborators.h"

namespace geneflow {
namespace {

RoutedResult Echo(const RequestDispatcher::Request& request) {
  RoutedResult result;
  result.session_id = request.session_id;
  result.success = true;
  result.response = "echo: " + request.message;
  return result;
}

TEST(RequestDispatcherTest, ParallelExecution) {
  int call_count = 0;
  absl::Mutex mu;

  auto route_func = [&](const RequestDispatcher::Request& request, std::shared_ptr<CancellationRequest>) {
    {
      absl::MutexLock lock(&mu);
      call_count++;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return absl::StatusOr<RoutedResult>(Echo(request));
  };

  RequestDispatcher dispatcher(route_func, 4);
  std::vector<RequestDispatcher::Request> requests = {
      {"one", "s1", "", std::nullopt},
      {"two", "s2", "", std::nullopt},
      {"three", "s3", "", std::nullopt},
      {"four", "s4", "", std::nullopt},
  };

  auto start = std::chrono::steady_clock::now();
  auto results = dispatcher.Dispatch(requests, nullptr);
  auto end = std::chrono::steady_clock::now();

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(call_count, 4);

  // Around 100ms when the requests overlap, 400ms when they do not.
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
  EXPECT_LT(duration, 350);

  ASSERT_TRUE(results[0].ok());
  EXPECT_EQ(results[0]->session_id, "s1");
  EXPECT_EQ(results[0]->response, "echo: one");
  ASSERT_TRUE(results[3].ok());
  EXPECT_EQ(results[3]->response, "echo: four");
}

TEST(RequestDispatcherTest, ResultsKeepInputOrder) {
  // Earlier requests finish last.
  auto route_func = [](const RequestDispatcher::Request& request, std::shared_ptr<CancellationRequest>) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * (5 - std::stoi(request.session_id))));
    return absl::StatusOr<RoutedResult>(Echo(request));
  };
  RequestDispatcher dispatcher(route_func, 2);

  std::vector<RequestDispatcher::Request> requests;
  for (int i = 0; i < 5; ++i) requests.push_back({"m" + std::to_string(i), std::to_string(i), "", std::nullopt});
  auto results = dispatcher.Dispatch(requests, nullptr);
  ASSERT_EQ(results.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(results[i].ok());
    EXPECT_EQ(results[i]->session_id, std::to_string(i));
  }
}

TEST(RequestDispatcherTest, Cancellation) {
  auto route_func = [](const RequestDispatcher::Request& request,
                       std::shared_ptr<CancellationRequest> cancellation) -> absl::StatusOr<RoutedResult> {
    for (int i = 0; i < 10; ++i) {
      if (cancellation && cancellation->IsCancelled()) return RunCancelledError(cancellation->Reason());
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return Echo(request);
  };

  RequestDispatcher dispatcher(route_func, 1);
  auto cancellation = std::make_shared<CancellationRequest>();
  std::vector<RequestDispatcher::Request> requests = {{"a", "s1", "", std::nullopt},
                                                      {"b", "s2", "", std::nullopt}};

  std::thread cancel_thread([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancellation->Cancel("shutting down");
  });

  auto results = dispatcher.Dispatch(requests, cancellation);
  cancel_thread.join();

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::kCancelled);
  }
}

TEST(RequestDispatcherTest, EmptyBatch) {
  RequestDispatcher dispatcher(
      [](const RequestDispatcher::Request& request, std::shared_ptr<CancellationRequest>) {
        return absl::StatusOr<RoutedResult>(Echo(request));
      },
      2);
  EXPECT_TRUE(dispatcher.Dispatch({}, nullptr).empty());
}

TEST(ParseBatchRequestsTest, MixesJsonAndPlainLines) {
  auto requests = ParseBatchRequests(
      "What is a codon?\n"
      "\n"
      R"({"message": "ATGAAATAA", "session_id": "s9", "compare_to": "ATGAAGTAA"})"
      "\n"
      R"({"message": "hi", "owner_id": null})",
      "default", "anon");
  ASSERT_TRUE(requests.ok()) << requests.status();
  ASSERT_EQ(requests->size(), 3u);
  EXPECT_EQ((*requests)[0].message, "What is a codon?");
  EXPECT_EQ((*requests)[0].session_id, "default");
  EXPECT_EQ((*requests)[1].session_id, "s9");
  EXPECT_EQ((*requests)[1].owner_id, "anon");
  ASSERT_TRUE((*requests)[1].compare_to.has_value());
  EXPECT_EQ(*(*requests)[1].compare_to, "ATGAAGTAA");
  EXPECT_EQ((*requests)[2].owner_id, "anon");
  EXPECT_FALSE((*requests)[2].compare_to.has_value());
}

TEST(ParseBatchRequestsTest, MistypedFieldsAreRejected) {
  for (const char* line : {R"({"message": "hi", "session_id": 42})", R"({"message": "hi", "owner_id": ["a"]})",
                           R"({"message": "hi", "compare_to": 1})", R"({"message": null})", R"({"message": "hi")"}) {
    auto requests = ParseBatchRequests(line, "default", "anon");
    ASSERT_FALSE(requests.ok()) << line;
    EXPECT_EQ(requests.status().code(), absl::StatusCode::kInvalidArgument) << line;
  }
}

class FixedCompletion : public TextCompletionClient {
 public:
  absl::StatusOr<Completion> Complete(const std::string&, const std::string& prompt, const std::vector<Message>&,
                                      const CancellationRequest*) override {
    return Completion{"re: " + prompt, 5, 5, "fixed"};
  }
  std::string model() const override { return "fixed"; }
};

TEST(RequestDispatcherTest, RoutesThroughRouterKeepingTurnsPaired) {
  Database db;
  ASSERT_TRUE(db.Init(":memory:").ok());
  auto store = SessionStore::Create(&db);
  ASSERT_TRUE(store.ok());
  PerformanceTracker tracker(&db, DefaultPriceTable());
  OfflineLiteratureClient literature;
  JsonVisualizationWriter visualization(::testing::TempDir() + "/dispatcher_test");
  JsonReportWriter reports(::testing::TempDir() + "/dispatcher_test");
  auto pipeline = PipelineOrchestrator::Builder(&tracker)
                      .WithLiteratureClient(&literature)
                      .WithVisualizationClient(&visualization)
                      .WithReportClient(&reports)
                      .Build();
  ASSERT_TRUE(pipeline.ok());
  FixedCompletion completion;
  RequestRouter router(store->get(), pipeline->get(), &completion, &tracker);
  RequestDispatcher dispatcher(&router, 4);

  auto a = (*store)->CreateSession("alice");
  auto b = (*store)->CreateSession("bob");
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  std::vector<RequestDispatcher::Request> requests = {
      {"a1", a->id, "alice", std::nullopt},
      {"b1", b->id, "bob", std::nullopt},
      {"GGTATAAAGGATGAAATAAGG", b->id, "bob", std::nullopt},
      {"b3", b->id, "bob", std::nullopt},
  };
  auto results = dispatcher.Dispatch(requests, nullptr);
  ASSERT_EQ(results.size(), 4u);
  for (const auto& result : results) {
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->success) << result->status;
  }
  EXPECT_EQ(results[2]->kind, RouteKind::kAnalysis);

  auto a_messages = (*store)->RecentMessages(a->id, 100);
  auto b_messages = (*store)->RecentMessages(b->id, 100);
  ASSERT_TRUE(a_messages.ok());
  ASSERT_TRUE(b_messages.ok());
  EXPECT_EQ(a_messages->size(), 2u);
  ASSERT_EQ(b_messages->size(), 6u);
  // Every user message is immediately followed by its own response.
  for (size_t i = 0; i < b_messages->size(); i += 2) {
    EXPECT_EQ((*b_messages)[i].role, Role::kUser);
    EXPECT_EQ((*b_messages)[i + 1].role, Role::kAssistant);
  }
}

}  // namespace
}  // namespace geneflow
