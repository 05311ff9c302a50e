#ifndef GENEFLOW_CORE_OPENAI_COMPLETION_CLIENT_H_
#define GENEFLOW_CORE_OPENAI_COMPLETION_CLIENT_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include <nlohmann/json.hpp>

#include "core/collaborators.h"
#include "core/http_client.h"

namespace geneflow {

// Text completion over an OpenAI-compatible /chat/completions endpoint.
class OpenAiCompletionClient : public TextCompletionClient {
 public:
  OpenAiCompletionClient(HttpClient* http_client, std::string api_key, std::string model, std::string base_url);

  absl::StatusOr<Completion> Complete(const std::string& system_prompt, const std::string& prompt,
                                      const std::vector<Message>& history,
                                      const CancellationRequest* cancel) override;

  std::string model() const override { return model_; }

  // Public for testing
  nlohmann::json AssemblePayload(const std::string& system_prompt, const std::string& prompt,
                                 const std::vector<Message>& history) const;
  absl::StatusOr<Completion> ParseResponse(const std::string& response_json, const nlohmann::json& payload) const;

  // Rough count for servers that omit usage: one token per four characters.
  static int EstimateTokens(size_t chars);

 private:
  HttpClient* http_client_;
  std::string api_key_;
  std::string model_;
  std::string base_url_;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_OPENAI_COMPLETION_CLIENT_H_
