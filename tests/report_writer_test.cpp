#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "orchestrator/report_writer.hpp"
#include "test_support.hpp"

namespace autolab::orchestrator {
namespace {

TEST(ReportWriterTest, ArchivesHypothesisWithOutcome) {
    testing::TempDir dir;
    const auto hypothesis = testing::CodeHypothesis("obj", "print('{\"score\": 1}')");
    analyst::ScoredOutcome outcome{};
    outcome.id = analyst::MakeOutcomeId(hypothesis.id);
    outcome.hypothesis_id = hypothesis.id;
    outcome.objective = "obj";
    outcome.classification = analyst::Classification::kSuccess;
    outcome.quality = 1.0;
    outcome.verdict.stdout_text = "bad byte \xff here";

    ArchiveExperiment(dir.Path() / "experiments", hypothesis, outcome);

    const auto path = dir.Path() / "experiments" / (outcome.id + ".json");
    ASSERT_TRUE(std::filesystem::exists(path));
    std::ifstream input(path);
    const auto record = nlohmann::json::parse(input);
    EXPECT_EQ(record["hypothesis"]["id"], hypothesis.id);
    EXPECT_EQ(record["hypothesis"]["program"]["kind"], "code");
    EXPECT_EQ(record["hypothesis"]["evaluation"]["metric"], "score");
    EXPECT_EQ(record["outcome"]["classification"], "success");
}

TEST(ReportWriterTest, RendersSweepProgram) {
    researcher::ParameterSweep sweep{};
    sweep.code_template = "n = {{n}}";
    sweep.parameter = "n";
    sweep.values = {"1", "2"};
    const auto hypothesis = researcher::MakeHypothesis("obj", "sweep n", "grid", sweep, {});
    const auto json = ToJson(hypothesis);
    EXPECT_EQ(json["program"]["kind"], "sweep");
    EXPECT_EQ(json["program"]["values"].size(), 2u);
    EXPECT_TRUE(json["evaluation"]["target"].is_null());
}

TEST(ReportWriterTest, ReportListsDiscoveriesAndInsights) {
    Checkpoint checkpoint{};
    checkpoint.objective = "find primes quickly";
    checkpoint.iteration = 4;
    checkpoint.total_experiments = 12;
    checkpoint.status = RunStatus::kCompleted;
    checkpoint.termination_reason = "iteration_budget";
    checkpoint.best_results.push_back(BestResult{"o-1", "sieve of Eratosthenes", 0.93, 2});

    cognition::KnowledgeEntry entry{};
    entry.id = "k-1";
    entry.classification = analyst::Classification::kSuccess;
    entry.insight = "sieves beat trial division";
    entry.evidence = {"o-2"};
    entry.supersedes = {"k-0"};
    entry.support = 2;

    const auto report = RenderResearchReport(checkpoint, {entry});
    EXPECT_EQ(report.rfind("RESEARCH REPORT", 0), 0u);
    EXPECT_NE(report.find("Objective: find primes quickly"), std::string::npos);
    EXPECT_NE(report.find("Total Iterations: 4"), std::string::npos);
    EXPECT_NE(report.find("Total Experiments: 12"), std::string::npos);
    EXPECT_NE(report.find("1. sieve of Eratosthenes (Score: 0.93"), std::string::npos);
    EXPECT_NE(report.find("[success] sieves beat trial division (2 experiments)"), std::string::npos);
}

TEST(ReportWriterTest, WritesReportFile) {
    testing::TempDir dir;
    Checkpoint checkpoint{};
    checkpoint.objective = "obj";
    const auto path = dir.Path() / "research_report.txt";
    WriteResearchReport(path, checkpoint, {});
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    EXPECT_NE(buffer.str().find("(none yet)"), std::string::npos);
}

}  // namespace
}  // namespace autolab::orchestrator
