#include "providers/litellm_provider.hpp"

#include <string>

#include "nlohmann/json.hpp"
#include "providers/http_client.hpp"
#include "utils/common.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

namespace autolab::providers {
namespace {

bool ShouldUseAnthropicMessages(const std::string& kind, const std::string& api_base) {
    return kind == "anthropic" || utils::ToLower(api_base).find("anthropic") != std::string::npos;
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const std::string& model,
                                     int max_tokens,
                                     double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    std::string system_prompt;
    for (const auto& msg : messages) {
        if (msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        payload["messages"].push_back({
            {"role", msg.role},
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
        });
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

nlohmann::json BuildOpenAiPayload(const std::vector<Message>& messages,
                                  const std::string& model,
                                  int max_tokens,
                                  double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

void ReadUsage(const nlohmann::json& usage, const char* key, const char* target, LLMResponse& response) {
    if (usage.contains(key) && usage[key].is_number_integer()) {
        response.usage[target] = usage[key].get<int>();
    }
}

}  // namespace

LiteLLMProvider::LiteLLMProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {
    is_openrouter_ = settings_.kind == "openrouter"
        || (!settings_.api_key.empty() && settings_.api_key.rfind("sk-or-", 0) == 0)
        || settings_.api_base.find("openrouter") != std::string::npos;
    use_anthropic_ = !is_openrouter_ && ShouldUseAnthropicMessages(settings_.kind, settings_.api_base);
}

std::string LiteLLMProvider::NormalizeModel(const std::string& model, bool is_openrouter) {
    // OpenRouter routes on "vendor/model"; direct endpoints want the bare model name.
    if (is_openrouter) {
        return model;
    }
    for (const char* prefix : {"anthropic/", "openai/"}) {
        const std::string value(prefix);
        if (model.rfind(value, 0) == 0) {
            return model.substr(value.size());
        }
    }
    return model;
}

LLMResponse LiteLLMProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const auto chosen_model = NormalizeModel(model.empty() ? settings_.model : model, is_openrouter_);
        const auto payload = use_anthropic_
            ? BuildAnthropicPayload(messages, chosen_model, max_tokens, temperature)
            : BuildOpenAiPayload(messages, chosen_model, max_tokens, temperature);

        const auto parsed = ParseUrl(settings_.api_base);
        const std::string endpoint = parsed.base_path + (use_anthropic_ ? "/messages" : "/chat/completions");
        auto client = MakeClient(parsed, settings_.timeout_seconds, settings_.use_proxy_for_llm);

        utils::LogDebug("llm", "POST " + parsed.host + endpoint,
                        {{"model", chosen_model},
                         {"api_key", MaskKey(settings_.api_key)},
                         {"style", use_anthropic_ ? "anthropic" : "openai"}});

        httplib::Headers headers{{"Content-Type", "application/json"}};
        if (!settings_.api_key.empty()) {
            if (use_anthropic_) {
                headers.emplace("x-api-key", settings_.api_key);
                headers.emplace("anthropic-version", "2023-06-01");
            } else {
                headers.emplace("Authorization", "Bearer " + settings_.api_key);
            }
        }

        auto response = client->Post(endpoint.c_str(), headers, utils::DumpJson(payload), "application/json");
        if (!response) {
            const auto err = response.error();
            const auto err_text = httplib::to_string(err);
            utils::LogWarn("llm", "request failed", {{"error", err_text}});
            return LLMResponse{
                .content = "Error calling LLM: request failed (" + err_text + ")",
                .finish_reason = "error"};
        }
        if (response->status >= 400) {
            utils::LogWarn("llm", "HTTP error",
                           {{"status", std::to_string(response->status)},
                            {"body", utils::Truncate(response->body, 300)}});
            return LLMResponse{
                .content = "Error calling LLM: HTTP " + std::to_string(response->status),
                .finish_reason = "error"};
        }

        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded()) {
            return LLMResponse{.content = "Error calling LLM: invalid response", .finish_reason = "error"};
        }

        LLMResponse parsed_response{};
        if (use_anthropic_) {
            if (json.contains("content") && json["content"].is_array()) {
                for (const auto& block : json["content"]) {
                    if (block.value("type", "") == "text") {
                        parsed_response.content += block.value("text", "");
                    }
                }
            }
            if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
                parsed_response.finish_reason = json["stop_reason"].get<std::string>();
            }
            if (json.contains("usage")) {
                ReadUsage(json["usage"], "input_tokens", "prompt_tokens", parsed_response);
                ReadUsage(json["usage"], "output_tokens", "completion_tokens", parsed_response);
            }
            return parsed_response;
        }

        if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
            return LLMResponse{.content = "Error calling LLM: invalid response", .finish_reason = "error"};
        }
        const auto& choice = json["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content")
            && choice["message"]["content"].is_string()) {
            parsed_response.content = choice["message"]["content"].get<std::string>();
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            parsed_response.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (json.contains("usage")) {
            ReadUsage(json["usage"], "prompt_tokens", "prompt_tokens", parsed_response);
            ReadUsage(json["usage"], "completion_tokens", "completion_tokens", parsed_response);
            ReadUsage(json["usage"], "total_tokens", "total_tokens", parsed_response);
        }
        return parsed_response;
    } catch (const std::exception& ex) {
        return LLMResponse{
            .content = std::string("Error calling LLM: ") + ex.what(),
            .finish_reason = "error"};
    }
}

}  // namespace autolab::providers
