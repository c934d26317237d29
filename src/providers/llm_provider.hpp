#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace autolab::providers {

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

struct ProviderSettings {
    // "openai", "anthropic", "openrouter", "vllm" or "ollama".
    std::string kind;
    std::string api_key;
    std::string api_base;
    std::string model;
    bool use_proxy_for_llm = false;
    int timeout_seconds = 60;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

ProviderSettings ResolveProviderSettings(const autolab::config::Config& config);
std::shared_ptr<LLMProvider> CreateProvider(const autolab::config::Config& config);

}  // namespace autolab::providers
