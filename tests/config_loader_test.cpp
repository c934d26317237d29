#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "config/config_loader.hpp"
#include "test_support.hpp"

namespace autolab::config {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* key, const char* value)
        : key_(key) {
        ::setenv(key, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(key_); }

private:
    const char* key_;
};

TEST(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
    Config config{};
    EXPECT_EQ(config.sandbox.max_wall_seconds, 30);
    EXPECT_EQ(config.sandbox.max_memory_mb, 1024);
    EXPECT_EQ(config.research.experiments_per_iteration, 3);
    EXPECT_EQ(config.research.max_iterations, 100);
    EXPECT_FALSE(config.sandbox.network_allowed);
}

TEST(ConfigLoaderTest, AppliesJsonSections) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "workspace": "lab",
        "sandbox": {"interpreter": "python3.12", "maxWallSeconds": 5, "networkAllowed": true},
        "research": {"maxIterations": 7, "experimentsPerIteration": 2, "analysisDepth": "deep"},
        "knowledge": {"capacity": 40, "topK": 3},
        "providers": {"preferred": "ollama", "ollama": {"model": "llama3"}},
        "log": {"level": "debug"}
    })"));
    EXPECT_EQ(config.workspace, "lab");
    EXPECT_EQ(config.sandbox.interpreter, "python3.12");
    EXPECT_EQ(config.sandbox.max_wall_seconds, 5);
    EXPECT_TRUE(config.sandbox.network_allowed);
    EXPECT_EQ(config.research.max_iterations, 7);
    EXPECT_EQ(config.research.experiments_per_iteration, 2);
    EXPECT_EQ(config.research.analysis_depth, "deep");
    EXPECT_EQ(config.knowledge.capacity, 40);
    EXPECT_EQ(config.knowledge.top_k, 3);
    EXPECT_EQ(config.providers.preferred, "ollama");
    EXPECT_EQ(config.providers.ollama.model, "llama3");
    EXPECT_EQ(config.log.level, "debug");
}

TEST(ConfigLoaderTest, IgnoresWrongTypes) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"maxWallSeconds": "ten"}})"));
    EXPECT_EQ(config.sandbox.max_wall_seconds, 30);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    testing::TempDir dir;
    const auto path = dir.Path() / "config.json";
    std::ofstream(path) << R"({"research": {"maxIterations": 9}})";
    ScopedEnv iterations("AUTOLAB_RESEARCH__MAX_ITERATIONS", "4");
    ScopedEnv memory("AUTOLAB_MAX_MEMORY_MB", "512");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.research.max_iterations, 4);
    EXPECT_EQ(config.sandbox.max_memory_mb, 512);
}

TEST(ConfigLoaderTest, InvalidFileKeepsDefaults) {
    testing::TempDir dir;
    const auto path = dir.Path() / "config.json";
    std::ofstream(path) << "{ broken";
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.research.max_iterations, 100);
}

TEST(ConfigLoaderTest, ClampsOutOfRangeValues) {
    Config config{};
    config.sandbox.max_wall_seconds = 0;
    config.research.experiments_per_iteration = 0;
    config.knowledge.capacity = 1;
    config.knowledge.similarity_threshold = 3.0;
    config.research.hypothesis_temperature = -1.0;
    ClampConfig(config);
    EXPECT_EQ(config.sandbox.max_wall_seconds, 1);
    EXPECT_EQ(config.research.experiments_per_iteration, 1);
    EXPECT_EQ(config.knowledge.capacity, 2);
    EXPECT_DOUBLE_EQ(config.knowledge.similarity_threshold, 1.0);
    EXPECT_DOUBLE_EQ(config.research.hypothesis_temperature, 0.0);
}

}  // namespace
}  // namespace autolab::config
