#include "providers/reasoning_backend.hpp"

#include <future>
#include <thread>
#include <vector>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace autolab::providers {

ProviderBackend::ProviderBackend(std::shared_ptr<LLMProvider> provider,
                                 std::string system_prompt,
                                 int max_tokens,
                                 std::chrono::seconds timeout)
    : provider_(std::move(provider))
    , system_prompt_(std::move(system_prompt))
    , max_tokens_(max_tokens)
    , timeout_(timeout) {}

std::string ProviderBackend::Complete(const std::string& prompt, double temperature) {
    if (!provider_) {
        throw utils::GenerationUnavailable("no reasoning backend configured");
    }
    std::vector<Message> messages;
    if (!system_prompt_.empty()) {
        messages.push_back(Message{"system", system_prompt_});
    }
    messages.push_back(Message{"user", prompt});

    // The worker owns copies of everything it touches; on timeout it is left to finish
    // on its own and its result is dropped.
    std::packaged_task<LLMResponse()> task(
        [provider = provider_, messages, max_tokens = max_tokens_, temperature]() {
            return provider->Chat(messages, "", max_tokens, temperature);
        });
    auto future = task.get_future();
    std::thread(std::move(task)).detach();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        utils::LogWarn("llm", "backend call timed out", {{"timeout_s", std::to_string(timeout_.count())}});
        throw utils::GenerationUnavailable("reasoning backend timed out after "
                                           + std::to_string(timeout_.count()) + "s");
    }
    LLMResponse response;
    try {
        response = future.get();
    } catch (const std::exception& ex) {
        throw utils::GenerationUnavailable(std::string("reasoning backend failed: ") + ex.what());
    }
    if (response.IsError()) {
        throw utils::GenerationUnavailable(response.content.empty() ? "reasoning backend returned an error"
                                                                    : response.content);
    }
    if (utils::Trim(response.content).empty()) {
        throw utils::GenerationUnavailable("reasoning backend returned an empty completion");
    }
    return response.content;
}

}  // namespace autolab::providers
