#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace autolab::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& section, const char* key, double& target) {
    if (section.contains(key) && section[key].is_number()) {
        target = section[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "apiKey", target.api_key);
    ReadString(source, "apiBase", target.api_base);
    ReadString(source, "model", target.model);
}

void OverrideString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideDouble(const char* primary, const char* secondary, double& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

void OverrideBool(const char* primary, const char* secondary, bool& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".autolab" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "workspace", config.workspace);

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "interpreter", config.sandbox.interpreter);
        ReadString(sandbox, "scriptName", config.sandbox.script_name);
        ReadString(sandbox, "scratchRoot", config.sandbox.scratch_root);
        ReadInt(sandbox, "maxWallSeconds", config.sandbox.max_wall_seconds);
        ReadInt(sandbox, "maxMemoryMb", config.sandbox.max_memory_mb);
        ReadInt(sandbox, "maxOutputBytes", config.sandbox.max_output_bytes);
        ReadInt(sandbox, "maxFileMb", config.sandbox.max_file_mb);
        ReadInt(sandbox, "killGraceMs", config.sandbox.kill_grace_ms);
        ReadBool(sandbox, "networkAllowed", config.sandbox.network_allowed);
    }

    if (data.contains("research") && data["research"].is_object()) {
        const auto& research = data["research"];
        ReadInt(research, "maxIterations", config.research.max_iterations);
        ReadInt(research, "experimentsPerIteration", config.research.experiments_per_iteration);
        ReadInt(research, "maxResearchSeconds", config.research.max_research_seconds);
        ReadInt(research, "parallelism", config.research.parallelism);
        ReadInt(research, "generationMaxAttempts", config.research.generation_max_attempts);
        ReadInt(research, "generationBackoffMs", config.research.generation_backoff_ms);
        ReadInt(research, "generationTimeoutS", config.research.generation_timeout_s);
        ReadDouble(research, "hypothesisTemperature", config.research.hypothesis_temperature);
        ReadString(research, "analysisDepth", config.research.analysis_depth);
        ReadInt(research, "recentWindow", config.research.recent_window);
        ReadInt(research, "iterationDelayMs", config.research.iteration_delay_ms);
        ReadInt(research, "maxTokens", config.research.max_tokens);
    }

    if (data.contains("knowledge") && data["knowledge"].is_object()) {
        const auto& knowledge = data["knowledge"];
        ReadInt(knowledge, "capacity", config.knowledge.capacity);
        ReadDouble(knowledge, "similarityThreshold", config.knowledge.similarity_threshold);
        ReadDouble(knowledge, "recencyHalfLife", config.knowledge.recency_half_life);
        ReadInt(knowledge, "topK", config.knowledge.top_k);
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        ReadString(providers, "preferred", config.providers.preferred);
        ReadBool(providers, "useProxyForLLM", config.providers.use_proxy_for_llm);
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
        if (providers.contains("ollama")) {
            ApplyProviderConfig(config.providers.ollama, providers["ollama"]);
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        ReadString(log, "level", config.log.level);
        ReadBool(log, "echoToStderr", config.log.echo_to_stderr);
    }
}

void ApplyConfigFromEnv(Config& config) {
    OverrideString("AUTOLAB_WORKSPACE", "AUTOLAB_WORKSPACE_DIR", config.workspace);

    OverrideString("AUTOLAB_SANDBOX__INTERPRETER", "AUTOLAB_SANDBOX_INTERPRETER", config.sandbox.interpreter);
    OverrideString("AUTOLAB_SANDBOX__SCRATCH_ROOT", "AUTOLAB_SANDBOX_SCRATCH_ROOT", config.sandbox.scratch_root);
    OverrideInt("AUTOLAB_SANDBOX__MAX_WALL_SECONDS", "AUTOLAB_MAX_WALL_SECONDS", config.sandbox.max_wall_seconds);
    OverrideInt("AUTOLAB_SANDBOX__MAX_MEMORY_MB", "AUTOLAB_MAX_MEMORY_MB", config.sandbox.max_memory_mb);
    OverrideInt("AUTOLAB_SANDBOX__MAX_OUTPUT_BYTES", "AUTOLAB_MAX_OUTPUT_BYTES", config.sandbox.max_output_bytes);
    OverrideBool("AUTOLAB_SANDBOX__NETWORK_ALLOWED", "AUTOLAB_NETWORK_ALLOWED", config.sandbox.network_allowed);

    OverrideInt("AUTOLAB_RESEARCH__MAX_ITERATIONS", "AUTOLAB_MAX_ITERATIONS", config.research.max_iterations);
    OverrideInt("AUTOLAB_RESEARCH__EXPERIMENTS_PER_ITERATION",
                "AUTOLAB_EXPERIMENTS_PER_ITERATION",
                config.research.experiments_per_iteration);
    OverrideInt("AUTOLAB_RESEARCH__MAX_RESEARCH_SECONDS",
                "AUTOLAB_MAX_RESEARCH_SECONDS",
                config.research.max_research_seconds);
    OverrideInt("AUTOLAB_RESEARCH__PARALLELISM", "AUTOLAB_PARALLELISM", config.research.parallelism);
    OverrideDouble("AUTOLAB_RESEARCH__HYPOTHESIS_TEMPERATURE",
                   "AUTOLAB_HYPOTHESIS_TEMPERATURE",
                   config.research.hypothesis_temperature);
    OverrideString("AUTOLAB_RESEARCH__ANALYSIS_DEPTH", "AUTOLAB_ANALYSIS_DEPTH", config.research.analysis_depth);

    OverrideInt("AUTOLAB_KNOWLEDGE__CAPACITY", "AUTOLAB_KNOWLEDGE_CAPACITY", config.knowledge.capacity);

    OverrideString("AUTOLAB_PROVIDERS__PREFERRED", "AUTOLAB_PROVIDER", config.providers.preferred);
    OverrideBool("AUTOLAB_PROVIDERS__USE_PROXY_FOR_LLM",
                 "AUTOLAB_PROVIDERS_USE_PROXY_FOR_LLM",
                 config.providers.use_proxy_for_llm);
    OverrideString("AUTOLAB_PROVIDERS__OPENAI__API_KEY", "OPENAI_API_KEY", config.providers.openai.api_key);
    OverrideString("AUTOLAB_PROVIDERS__ANTHROPIC__API_KEY", "ANTHROPIC_API_KEY", config.providers.anthropic.api_key);
    OverrideString("AUTOLAB_PROVIDERS__OPENROUTER__API_KEY",
                   "OPENROUTER_API_KEY",
                   config.providers.openrouter.api_key);
    OverrideString("AUTOLAB_PROVIDERS__VLLM__API_BASE", "AUTOLAB_PROVIDERS_VLLM_API_BASE", config.providers.vllm.api_base);
    OverrideString("AUTOLAB_PROVIDERS__OLLAMA__API_BASE",
                   "AUTOLAB_PROVIDERS_OLLAMA_API_BASE",
                   config.providers.ollama.api_base);
    OverrideString("AUTOLAB_PROVIDERS__OLLAMA__MODEL", "AUTOLAB_PROVIDERS_OLLAMA_MODEL", config.providers.ollama.model);

    OverrideString("AUTOLAB_LOG__LEVEL", "AUTOLAB_LOG_LEVEL", config.log.level);
}

void ClampConfig(Config& config) {
    config.sandbox.max_wall_seconds = std::max(1, config.sandbox.max_wall_seconds);
    config.sandbox.max_memory_mb = std::max(16, config.sandbox.max_memory_mb);
    config.sandbox.max_output_bytes = std::max(256, config.sandbox.max_output_bytes);
    config.sandbox.max_file_mb = std::max(1, config.sandbox.max_file_mb);
    config.sandbox.kill_grace_ms = std::max(0, config.sandbox.kill_grace_ms);

    config.research.max_iterations = std::max(0, config.research.max_iterations);
    config.research.experiments_per_iteration = std::max(1, config.research.experiments_per_iteration);
    config.research.max_research_seconds = std::max(0, config.research.max_research_seconds);
    config.research.parallelism = std::max(0, config.research.parallelism);
    config.research.generation_max_attempts = std::max(1, config.research.generation_max_attempts);
    config.research.generation_backoff_ms = std::max(0, config.research.generation_backoff_ms);
    config.research.generation_timeout_s = std::max(1, config.research.generation_timeout_s);
    config.research.recent_window = std::max(1, config.research.recent_window);
    config.research.iteration_delay_ms = std::max(0, config.research.iteration_delay_ms);
    config.research.hypothesis_temperature = std::clamp(config.research.hypothesis_temperature, 0.0, 2.0);

    // Consolidation folds at least two entries, so capacity below two cannot hold.
    config.knowledge.capacity = std::max(2, config.knowledge.capacity);
    config.knowledge.similarity_threshold = std::clamp(config.knowledge.similarity_threshold, 0.0, 1.0);
    config.knowledge.recency_half_life = std::max(1.0, config.knowledge.recency_half_life);
    config.knowledge.top_k = std::max(1, config.knowledge.top_k);
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    const auto config_path = path.empty() ? DefaultConfigPath() : path;
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "keeping defaults, config file is not valid JSON",
                           {{"path", config_path.string()}, {"error", ex.what()}});
        }
    } else if (!path.empty()) {
        utils::LogWarn("config", "config file not found, using defaults", {{"path", path.string()}});
    }

    ApplyConfigFromEnv(config);
    ClampConfig(config);
    return config;
}

}  // namespace autolab::config
