#include <gtest/gtest.h>

#include <memory>

#include "providers/http_client.hpp"
#include "providers/litellm_provider.hpp"
#include "providers/llm_provider.hpp"
#include "providers/ollama_provider.hpp"

namespace autolab::providers {
namespace {

config::Config WithKeys(bool openrouter, bool anthropic, bool openai, bool vllm) {
    config::Config config{};
    if (openrouter) {
        config.providers.openrouter.api_key = "sk-or-test-key";
    }
    if (anthropic) {
        config.providers.anthropic.api_key = "sk-ant-test-key";
    }
    if (openai) {
        config.providers.openai.api_key = "sk-test-key";
    }
    if (vllm) {
        config.providers.vllm.api_base = "http://gpu-box:8000/v1";
    }
    return config;
}

TEST(ResolveProviderSettingsTest, AutoPicksFirstConfiguredProvider) {
    EXPECT_EQ(ResolveProviderSettings(WithKeys(true, true, true, true)).kind, "openrouter");
    EXPECT_EQ(ResolveProviderSettings(WithKeys(false, true, true, true)).kind, "anthropic");
    EXPECT_EQ(ResolveProviderSettings(WithKeys(false, false, true, true)).kind, "openai");
    EXPECT_EQ(ResolveProviderSettings(WithKeys(false, false, false, true)).kind, "vllm");
    EXPECT_EQ(ResolveProviderSettings(WithKeys(false, false, false, false)).kind, "ollama");
}

TEST(ResolveProviderSettingsTest, AppliesDefaultsAndOverrides) {
    auto config = WithKeys(false, false, false, false);
    const auto local = ResolveProviderSettings(config);
    EXPECT_EQ(local.api_base, "http://localhost:11434");
    EXPECT_EQ(local.model, "mistral");

    auto openai = WithKeys(false, false, true, false);
    openai.providers.openai.model = "gpt-4.1";
    const auto hosted = ResolveProviderSettings(openai);
    EXPECT_EQ(hosted.api_base, "https://api.openai.com/v1");
    EXPECT_EQ(hosted.model, "gpt-4.1");
    EXPECT_EQ(hosted.api_key, "sk-test-key");

    const auto vllm = ResolveProviderSettings(WithKeys(false, false, false, true));
    EXPECT_EQ(vllm.api_base, "http://gpu-box:8000/v1");
}

TEST(ResolveProviderSettingsTest, PreferredOverridesAutoOrder) {
    auto config = WithKeys(true, true, false, false);
    config.providers.preferred = "anthropic";
    EXPECT_EQ(ResolveProviderSettings(config).kind, "anthropic");
    config.providers.preferred = "ollama";
    EXPECT_EQ(ResolveProviderSettings(config).kind, "ollama");
}

TEST(ResolveProviderSettingsTest, TimeoutFollowsGenerationTimeout) {
    auto config = WithKeys(false, false, false, false);
    config.research.generation_timeout_s = 42;
    EXPECT_EQ(ResolveProviderSettings(config).timeout_seconds, 42);
    config.research.generation_timeout_s = 0;
    EXPECT_EQ(ResolveProviderSettings(config).timeout_seconds, 1);
    config.providers.use_proxy_for_llm = true;
    EXPECT_TRUE(ResolveProviderSettings(config).use_proxy_for_llm);
}

TEST(CreateProviderTest, LocalFallbackUsesOllama) {
    const auto provider = CreateProvider(WithKeys(false, false, false, false));
    EXPECT_NE(std::dynamic_pointer_cast<OllamaProvider>(provider), nullptr);
    EXPECT_EQ(provider->GetDefaultModel(), "mistral");

    const auto hosted = CreateProvider(WithKeys(false, true, false, false));
    EXPECT_NE(std::dynamic_pointer_cast<LiteLLMProvider>(hosted), nullptr);
    EXPECT_EQ(hosted->GetDefaultModel(), "claude-opus-4-5");
}

TEST(HttpClientTest, ParsesBaseUrls) {
    const auto https = ParseUrl("https://api.openai.com/v1/");
    EXPECT_TRUE(https.https);
    EXPECT_EQ(https.host, "api.openai.com");
    EXPECT_EQ(https.port, 443);
    EXPECT_EQ(https.base_path, "/v1");

    const auto local = ParseUrl("http://localhost:11434");
    EXPECT_FALSE(local.https);
    EXPECT_EQ(local.host, "localhost");
    EXPECT_EQ(local.port, 11434);
    EXPECT_TRUE(local.base_path.empty());
}

TEST(HttpClientTest, MasksKeys) {
    EXPECT_EQ(MaskKey("short"), "****");
    EXPECT_EQ(MaskKey("sk-abcdefgh1234"), "sk-a****1234");
}

}  // namespace
}  // namespace autolab::providers
