#include "core/openai_completion_client.h"

#include "absl/log/log.h"
#include "absl/strings/strip.h"

#include "core/errors.h"

namespace geneflow {

OpenAiCompletionClient::OpenAiCompletionClient(HttpClient* http_client, std::string api_key, std::string model,
                                               std::string base_url)
    : http_client_(http_client),
      api_key_(std::move(api_key)),
      model_(std::move(model)),
      base_url_(std::string(absl::StripSuffix(base_url, "/"))) {}

int OpenAiCompletionClient::EstimateTokens(size_t chars) { return static_cast<int>((chars + 3) / 4); }

nlohmann::json OpenAiCompletionClient::AssemblePayload(const std::string& system_prompt, const std::string& prompt,
                                                       const std::vector<Message>& history) const {
  nlohmann::json messages = nlohmann::json::array();
  if (!system_prompt.empty()) messages.push_back({{"role", "system"}, {"content", system_prompt}});

  for (const auto& msg : history) {
    // Session-level system notes are not replayed to the model.
    if (msg.role == Role::kSystem) continue;
    std::string role = RoleName(msg.role);
    if (!messages.empty() && messages.back()["role"] == role && msg.role == Role::kUser) {
      messages.back()["content"] = messages.back()["content"].get<std::string>() + "\n" + msg.content;
    } else {
      messages.push_back({{"role", role}, {"content", msg.content}});
    }
  }

  if (!messages.empty() && messages.back()["role"] == "user") {
    messages.back()["content"] = messages.back()["content"].get<std::string>() + "\n" + prompt;
  } else {
    messages.push_back({{"role", "user"}, {"content", prompt}});
  }

  return nlohmann::json{{"model", model_}, {"messages", messages}};
}

absl::StatusOr<Completion> OpenAiCompletionClient::ParseResponse(const std::string& response_json,
                                                                 const nlohmann::json& payload) const {
  auto j = nlohmann::json::parse(response_json, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    LOG(ERROR) << "Failed to parse completion response: " << response_json.substr(0, 256);
    return PermanentCollaboratorError("Failed to parse completion response");
  }

  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    return PermanentCollaboratorError("No choices in completion response");
  }
  const auto& choice = j["choices"][0];
  if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
    return PermanentCollaboratorError("Completion choice missing 'message'");
  }
  const auto& msg = choice["message"];
  if (!msg.contains("content") || !msg["content"].is_string()) {
    return PermanentCollaboratorError("Completion message has no text content");
  }

  Completion completion;
  completion.text = msg["content"].get<std::string>();
  completion.model = j.contains("model") && j["model"].is_string() ? j["model"].get<std::string>() : model_;

  // Missing or non-integer usage counts are estimated from the text sizes.
  const nlohmann::json usage = j.contains("usage") && j["usage"].is_object() ? j["usage"] : nlohmann::json::object();
  if (usage.contains("prompt_tokens") && usage["prompt_tokens"].is_number_integer()) {
    completion.input_tokens = usage["prompt_tokens"].get<int>();
  } else {
    size_t prompt_chars = 0;
    if (payload.contains("messages") && payload["messages"].is_array()) {
      for (const auto& m : payload["messages"]) {
        if (m.contains("content") && m["content"].is_string()) {
          prompt_chars += m["content"].get_ref<const std::string&>().size();
        }
      }
    }
    completion.input_tokens = EstimateTokens(prompt_chars);
    VLOG(1) << "Completion response had no prompt token count; estimated " << completion.input_tokens;
  }
  if (usage.contains("completion_tokens") && usage["completion_tokens"].is_number_integer()) {
    completion.output_tokens = usage["completion_tokens"].get<int>();
  } else {
    completion.output_tokens = EstimateTokens(completion.text.size());
    VLOG(1) << "Completion response had no completion token count; estimated " << completion.output_tokens;
  }
  return completion;
}

absl::StatusOr<Completion> OpenAiCompletionClient::Complete(const std::string& system_prompt,
                                                            const std::string& prompt,
                                                            const std::vector<Message>& history,
                                                            const CancellationRequest* cancel) {
  if (http_client_ == nullptr) return PermanentCollaboratorError("No HTTP client configured");
  if (api_key_.empty()) return PermanentCollaboratorError("No API key configured for " + base_url_);

  nlohmann::json payload = AssemblePayload(system_prompt, prompt, history);
  std::vector<std::string> headers = {"Content-Type: application/json", "Authorization: Bearer " + api_key_};
  std::string url = base_url_ + "/chat/completions";

  ASSIGN_OR_RETURN(std::string response,
                   http_client_->Post(url, payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                                      headers, cancel));
  return ParseResponse(response, payload);
}

}  // namespace geneflow
