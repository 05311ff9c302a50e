#include "core/openai_completion_client.h"

#include <gtest/gtest.h>

#include "absl/strings/match.h"

#include "core/errors.h"

namespace geneflow {
namespace {

class FakeHttpClient : public HttpClient {
 public:
  absl::StatusOr<std::string> Post(const std::string& url, const std::string& body,
                                   const std::vector<std::string>& headers,
                                   const CancellationRequest* cancel) override {
    last_url = url;
    last_body = body;
    last_headers = headers;
    (void)cancel;
    return response;
  }

  absl::StatusOr<std::string> response = std::string("{}");
  std::string last_url;
  std::string last_body;
  std::vector<std::string> last_headers;
};

Message Msg(Role role, const std::string& content) {
  Message m;
  m.role = role;
  m.content = content;
  return m;
}

class OpenAiCompletionClientTest : public ::testing::Test {
 protected:
  FakeHttpClient http;
};

TEST_F(OpenAiCompletionClientTest, PayloadStructure) {
  OpenAiCompletionClient client(&http, "key", "gpt-4o-mini", "https://api.openai.com/v1");
  std::vector<Message> history = {Msg(Role::kUser, "What is GC content?"),
                                  Msg(Role::kAssistant, "The fraction of G and C."),
                                  Msg(Role::kSystem, "internal note")};
  nlohmann::json payload = client.AssemblePayload("You are helpful.", "And ORFs?", history);

  EXPECT_EQ(payload["model"], "gpt-4o-mini");
  const auto& messages = payload["messages"];
  ASSERT_EQ(messages.size(), 4);
  EXPECT_EQ(messages[0]["role"], "system");
  EXPECT_EQ(messages[1]["role"], "user");
  EXPECT_EQ(messages[2]["role"], "assistant");
  EXPECT_EQ(messages[3]["role"], "user");
  EXPECT_EQ(messages[3]["content"], "And ORFs?");
}

TEST_F(OpenAiCompletionClientTest, ConsecutiveUserMessagesAreMerged) {
  OpenAiCompletionClient client(&http, "key", "m", "http://x");
  nlohmann::json payload = client.AssemblePayload("", "second", {Msg(Role::kUser, "first")});
  ASSERT_EQ(payload["messages"].size(), 1);
  EXPECT_EQ(payload["messages"][0]["content"], "first\nsecond");
}

TEST_F(OpenAiCompletionClientTest, CompletePostsAndReadsUsage) {
  http.response = std::string(R"({
    "model": "gpt-4o-mini-2024",
    "choices": [{"message": {"role": "assistant", "content": "ORFs are open reading frames."}}],
    "usage": {"prompt_tokens": 42, "completion_tokens": 7}
  })");
  OpenAiCompletionClient client(&http, "secret", "gpt-4o-mini", "https://example.com/v1/");
  auto completion = client.Complete("sys", "Explain ORFs", {}, nullptr);
  ASSERT_TRUE(completion.ok()) << completion.status();
  EXPECT_EQ(completion->text, "ORFs are open reading frames.");
  EXPECT_EQ(completion->input_tokens, 42);
  EXPECT_EQ(completion->output_tokens, 7);
  EXPECT_EQ(completion->model, "gpt-4o-mini-2024");

  EXPECT_EQ(http.last_url, "https://example.com/v1/chat/completions");
  bool has_auth = false;
  for (const auto& h : http.last_headers) has_auth |= h == "Authorization: Bearer secret";
  EXPECT_TRUE(has_auth);
  EXPECT_TRUE(absl::StrContains(http.last_body, "Explain ORFs"));
}

TEST_F(OpenAiCompletionClientTest, MissingUsageIsEstimated) {
  http.response = std::string(R"({"choices": [{"message": {"content": "12345678"}}]})");
  OpenAiCompletionClient client(&http, "k", "m", "http://x");
  auto completion = client.Complete("", "abcd", {}, nullptr);
  ASSERT_TRUE(completion.ok());
  EXPECT_EQ(completion->output_tokens, 2);
  EXPECT_EQ(completion->input_tokens, 1);
  EXPECT_EQ(completion->model, "m");
}

TEST_F(OpenAiCompletionClientTest, MistypedUsageCountsAreEstimated) {
  OpenAiCompletionClient client(&http, "k", "m", "http://x");
  http.response = std::string(
      R"({"choices": [{"message": {"content": "12345678"}}], "usage": {"prompt_tokens": null, "completion_tokens": 3}})");
  auto completion = client.Complete("", "abcd", {}, nullptr);
  ASSERT_TRUE(completion.ok()) << completion.status();
  EXPECT_EQ(completion->input_tokens, 1);
  EXPECT_EQ(completion->output_tokens, 3);

  http.response = std::string(
      R"({"choices": [{"message": {"content": "12345678"}}], "usage": {"prompt_tokens": 7, "completion_tokens": "many"}})");
  completion = client.Complete("", "abcd", {}, nullptr);
  ASSERT_TRUE(completion.ok()) << completion.status();
  EXPECT_EQ(completion->input_tokens, 7);
  EXPECT_EQ(completion->output_tokens, 2);

  http.response = std::string(R"({"choices": [{"message": {"content": "12345678"}}], "usage": "n/a"})");
  completion = client.Complete("", "abcd", {}, nullptr);
  ASSERT_TRUE(completion.ok()) << completion.status();
  EXPECT_EQ(completion->output_tokens, 2);
}

TEST_F(OpenAiCompletionClientTest, MalformedResponsesArePermanent) {
  OpenAiCompletionClient client(&http, "k", "m", "http://x");
  for (const char* body : {"not json", "{}", R"({"choices": []})", R"({"choices": [{"message": {"content": null}}]})"}) {
    http.response = std::string(body);
    auto completion = client.Complete("", "q", {}, nullptr);
    ASSERT_FALSE(completion.ok()) << body;
    EXPECT_EQ(GetErrorKind(completion.status()), ErrorKind::kPermanentCollaborator) << body;
  }
}

TEST_F(OpenAiCompletionClientTest, TransportErrorsPropagate) {
  http.response = absl::ResourceExhaustedError("HTTP error 429");
  OpenAiCompletionClient client(&http, "k", "m", "http://x");
  auto completion = client.Complete("", "q", {}, nullptr);
  ASSERT_FALSE(completion.ok());
  EXPECT_TRUE(IsTransient(completion.status()));
}

TEST_F(OpenAiCompletionClientTest, MissingApiKeyIsPermanent) {
  OpenAiCompletionClient client(&http, "", "m", "http://x");
  auto completion = client.Complete("", "q", {}, nullptr);
  EXPECT_EQ(GetErrorKind(completion.status()), ErrorKind::kPermanentCollaborator);
  EXPECT_TRUE(http.last_url.empty());
}

}  // namespace
}  // namespace geneflow
