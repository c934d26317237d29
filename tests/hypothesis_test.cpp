#include <gtest/gtest.h>

#include "researcher/hypothesis.hpp"

namespace autolab::researcher {
namespace {

TEST(HypothesisTest, IdDependsOnObjectiveAndProgram) {
    const ExperimentProgram a = CodeExperiment{"print(1)"};
    const ExperimentProgram b = CodeExperiment{"print(2)"};
    EXPECT_EQ(MakeHypothesisId("sort faster", a), MakeHypothesisId("sort faster", a));
    EXPECT_NE(MakeHypothesisId("sort faster", a), MakeHypothesisId("sort faster", b));
    EXPECT_NE(MakeHypothesisId("sort faster", a), MakeHypothesisId("search faster", a));
    EXPECT_EQ(MakeHypothesisId("x", a).rfind("h-", 0), 0u);
    EXPECT_EQ(MakeHypothesisId("x", a).size(), 18u);
}

TEST(HypothesisTest, SweepRendersOneCopyPerValue) {
    ParameterSweep sweep{};
    sweep.code_template = "n = {{n}}\nprint(n)";
    sweep.parameter = "n";
    sweep.values = {"1", "10"};
    const auto rendered = RenderProgram(ExperimentProgram{sweep});
    EXPECT_NE(rendered.find("n = 1\n"), std::string::npos);
    EXPECT_NE(rendered.find("n = 10\n"), std::string::npos);
    EXPECT_EQ(rendered.find("{{n}}"), std::string::npos);
}

TEST(HypothesisTest, ProgramHashIgnoresProgramKind) {
    ParameterSweep sweep{};
    sweep.code_template = "x = {{v}}";
    sweep.parameter = "v";
    sweep.values = {"3"};
    const ExperimentProgram swept = sweep;
    const ExperimentProgram plain = CodeExperiment{RenderProgram(swept)};
    EXPECT_EQ(ProgramHash(swept), ProgramHash(plain));
    EXPECT_EQ(ProgramHash(plain).size(), 16u);
}

TEST(HypothesisTest, ParsesEvaluationAliases) {
    EXPECT_EQ(ParseEvaluationKind(" JSON "), EvaluationKind::kJsonMetric);
    EXPECT_EQ(ParseEvaluationKind("metric_line"), EvaluationKind::kMetricLine);
    EXPECT_EQ(ParseEvaluationKind("exit"), EvaluationKind::kExitStatus);
    EXPECT_EQ(ParseEvaluationKind("contains"), EvaluationKind::kOutputContains);
    EXPECT_FALSE(ParseEvaluationKind("vibes").has_value());
    EXPECT_EQ(ParseMetricDirection("Minimize"), MetricDirection::kMinimize);
    EXPECT_EQ(ParseMetricDirection("higher"), MetricDirection::kMaximize);
    EXPECT_FALSE(ParseMetricDirection("sideways").has_value());
}

TEST(HypothesisTest, MakeHypothesisFillsIdentity) {
    const auto hypothesis = MakeHypothesis("obj", "desc", "approach", CodeExperiment{"print(1)"}, {}, 4);
    EXPECT_EQ(hypothesis.id, MakeHypothesisId("obj", CodeExperiment{"print(1)"}));
    EXPECT_EQ(hypothesis.sequence, 4u);
    EXPECT_FALSE(hypothesis.created_at.empty());
    EXPECT_FALSE(hypothesis.IsSweep());
}

}  // namespace
}  // namespace autolab::researcher
