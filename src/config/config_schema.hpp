#pragma once

#include <string>

namespace autolab::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::string model;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    ProviderConfig vllm;
    ProviderConfig ollama;
    // One of "auto", "openai", "anthropic", "openrouter", "vllm", "ollama".
    std::string preferred = "auto";
    bool use_proxy_for_llm = false;
};

struct SandboxConfig {
    std::string interpreter = "python3";
    std::string script_name = "experiment.py";
    // Parent of the per-run scratch directories. Empty means <workspace>/tmp.
    std::string scratch_root;
    int max_wall_seconds = 30;
    int max_memory_mb = 1024;
    int max_output_bytes = 10000;
    int max_file_mb = 64;
    int kill_grace_ms = 500;
    bool network_allowed = false;
};

struct ResearchConfig {
    int max_iterations = 100;
    int experiments_per_iteration = 3;
    // Accumulated across resumes. 0 disables the wall-clock budget.
    int max_research_seconds = 0;
    // Worker pool size. 0 means hardware concurrency.
    int parallelism = 0;
    int generation_max_attempts = 3;
    int generation_backoff_ms = 5000;
    int generation_timeout_s = 60;
    double hypothesis_temperature = 0.7;
    // "basic" scores only; "moderate" and "deep" also ask the backend to interpret outcomes.
    std::string analysis_depth = "basic";
    int recent_window = 10;
    int iteration_delay_ms = 2000;
    int max_tokens = 4096;
};

struct KnowledgeConfig {
    int capacity = 500;
    double similarity_threshold = 0.8;
    double recency_half_life = 50.0;
    int top_k = 5;
};

struct LogSettings {
    std::string level = "info";
    bool echo_to_stderr = true;
};

struct Config {
    std::string workspace = "research_workspace";
    SandboxConfig sandbox;
    ResearchConfig research;
    KnowledgeConfig knowledge;
    ProvidersConfig providers;
    LogSettings log;
};

}  // namespace autolab::config
