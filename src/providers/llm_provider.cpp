#include "providers/llm_provider.hpp"

#include <algorithm>

#include "providers/litellm_provider.hpp"
#include "providers/ollama_provider.hpp"
#include "utils/logging.hpp"

namespace autolab::providers {
namespace {

ProviderSettings FromProvider(const std::string& kind,
                              const autolab::config::ProviderConfig& provider,
                              const std::string& default_base,
                              const std::string& default_model) {
    ProviderSettings settings{};
    settings.kind = kind;
    settings.api_key = provider.api_key;
    settings.api_base = provider.api_base.empty() ? default_base : provider.api_base;
    settings.model = provider.model.empty() ? default_model : provider.model;
    return settings;
}

ProviderSettings SettingsForKind(const std::string& kind, const autolab::config::ProvidersConfig& providers) {
    if (kind == "openrouter") {
        return FromProvider(kind, providers.openrouter, "https://openrouter.ai/api/v1", "anthropic/claude-opus-4-5");
    }
    if (kind == "anthropic") {
        return FromProvider(kind, providers.anthropic, "https://api.anthropic.com/v1", "claude-opus-4-5");
    }
    if (kind == "openai") {
        return FromProvider(kind, providers.openai, "https://api.openai.com/v1", "gpt-4o-mini");
    }
    if (kind == "vllm") {
        return FromProvider(kind, providers.vllm, "http://localhost:8000/v1", "default");
    }
    return FromProvider("ollama", providers.ollama, "http://localhost:11434", "mistral");
}

}  // namespace

ProviderSettings ResolveProviderSettings(const autolab::config::Config& config) {
    const auto& providers = config.providers;
    std::string kind = providers.preferred;
    if (kind.empty() || kind == "auto") {
        if (!providers.openrouter.api_key.empty()) {
            kind = "openrouter";
        } else if (!providers.anthropic.api_key.empty()) {
            kind = "anthropic";
        } else if (!providers.openai.api_key.empty()) {
            kind = "openai";
        } else if (!providers.vllm.api_key.empty() || !providers.vllm.api_base.empty()) {
            kind = "vllm";
        } else {
            // No hosted credentials: fall back to a local model.
            kind = "ollama";
        }
    }
    auto settings = SettingsForKind(kind, providers);
    settings.use_proxy_for_llm = providers.use_proxy_for_llm;
    settings.timeout_seconds = std::max(config.research.generation_timeout_s, 1);
    return settings;
}

std::shared_ptr<LLMProvider> CreateProvider(const autolab::config::Config& config) {
    const auto settings = ResolveProviderSettings(config);
    utils::LogInfo("llm", "using reasoning backend",
                   {{"provider", settings.kind}, {"model", settings.model}, {"base", settings.api_base}});
    if (settings.kind == "ollama") {
        return std::make_shared<OllamaProvider>(settings);
    }
    return std::make_shared<LiteLLMProvider>(settings);
}

}  // namespace autolab::providers
