#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "providers/llm_provider.hpp"

namespace autolab::providers {

// Text-in/text-out capability used by the Researcher and, optionally, the Analyst.
// Implementations throw utils::GenerationUnavailable when no usable text comes back.
class ReasoningBackend {
public:
    virtual ~ReasoningBackend() = default;
    virtual std::string Complete(const std::string& prompt, double temperature) = 0;
};

// Adapts an LLMProvider and bounds each call with a caller-side timeout, so a hung
// connection cannot stall the research loop past `timeout`.
class ProviderBackend : public ReasoningBackend {
public:
    ProviderBackend(std::shared_ptr<LLMProvider> provider,
                    std::string system_prompt,
                    int max_tokens,
                    std::chrono::seconds timeout);

    std::string Complete(const std::string& prompt, double temperature) override;

private:
    std::shared_ptr<LLMProvider> provider_;
    std::string system_prompt_;
    int max_tokens_ = 4096;
    std::chrono::seconds timeout_;
};

}  // namespace autolab::providers
