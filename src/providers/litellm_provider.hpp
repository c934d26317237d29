#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace autolab::providers {

// Hosted chat-completion endpoints: OpenAI-compatible (OpenAI, OpenRouter, vLLM) and
// the Anthropic messages API.
class LiteLLMProvider : public LLMProvider {
public:
    explicit LiteLLMProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
    bool is_openrouter_ = false;
    bool use_anthropic_ = false;

    static std::string NormalizeModel(const std::string& model, bool is_openrouter);
};

}  // namespace autolab::providers
