#include "providers/ollama_provider.hpp"

#include "nlohmann/json.hpp"
#include "providers/http_client.hpp"
#include "utils/common.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

namespace autolab::providers {

OllamaProvider::OllamaProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

LLMResponse OllamaProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        nlohmann::json payload;
        payload["model"] = model.empty() ? settings_.model : model;
        payload["stream"] = false;
        payload["options"] = {{"temperature", temperature}, {"num_predict", max_tokens}};
        payload["messages"] = nlohmann::json::array();
        for (const auto& msg : messages) {
            payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
        }

        const auto parsed = ParseUrl(settings_.api_base);
        const std::string endpoint = parsed.base_path + "/api/chat";
        auto client = MakeClient(parsed, settings_.timeout_seconds, settings_.use_proxy_for_llm);
        utils::LogDebug("llm", "POST " + parsed.host + endpoint, {{"model", payload["model"].get<std::string>()}});

        auto response = client->Post(endpoint.c_str(), utils::DumpJson(payload), "application/json");
        if (!response) {
            const auto err_text = httplib::to_string(response.error());
            utils::LogWarn("llm", "ollama request failed", {{"error", err_text}});
            return LLMResponse{
                .content = "Error calling LLM: request failed (" + err_text + ")",
                .finish_reason = "error"};
        }
        if (response->status >= 400) {
            utils::LogWarn("llm", "ollama HTTP error",
                           {{"status", std::to_string(response->status)},
                            {"body", utils::Truncate(response->body, 300)}});
            return LLMResponse{
                .content = "Error calling LLM: HTTP " + std::to_string(response->status),
                .finish_reason = "error"};
        }

        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded() || !json.contains("message") || !json["message"].is_object()) {
            return LLMResponse{.content = "Error calling LLM: invalid response", .finish_reason = "error"};
        }
        LLMResponse parsed_response{};
        parsed_response.content = json["message"].value("content", "");
        if (json.value("done", true) == false) {
            parsed_response.finish_reason = "length";
        }
        if (json.contains("prompt_eval_count") && json["prompt_eval_count"].is_number_integer()) {
            parsed_response.usage["prompt_tokens"] = json["prompt_eval_count"].get<int>();
        }
        if (json.contains("eval_count") && json["eval_count"].is_number_integer()) {
            parsed_response.usage["completion_tokens"] = json["eval_count"].get<int>();
        }
        return parsed_response;
    } catch (const std::exception& ex) {
        return LLMResponse{
            .content = std::string("Error calling LLM: ") + ex.what(),
            .finish_reason = "error"};
    }
}

}  // namespace autolab::providers
