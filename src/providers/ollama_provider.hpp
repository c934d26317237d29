#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace autolab::providers {

// Local model served by Ollama's /api/chat endpoint.
class OllamaProvider : public LLMProvider {
public:
    explicit OllamaProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
};

}  // namespace autolab::providers
