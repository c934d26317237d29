#include <gtest/gtest.h>

#include <memory>

#include "researcher/researcher.hpp"
#include "utils/errors.hpp"

namespace autolab::researcher {
namespace {

class ScriptedBackend : public providers::ReasoningBackend {
public:
    explicit ScriptedBackend(std::string response)
        : response_(std::move(response)) {}

    std::string Complete(const std::string& prompt, double temperature) override {
        ++calls;
        last_prompt = prompt;
        last_temperature = temperature;
        return response_;
    }

    int calls = 0;
    std::string last_prompt;
    double last_temperature = 0.0;

private:
    std::string response_;
};

const char* kThreeProposals = R"RESP(Here are my ideas.

HYPOTHESIS: Sieve beats trial division
APPROACH: sieve
```python
import json
print(json.dumps({"primes_per_sec": 1200}))
```
EVALUATION: json_metric
METRIC: primes_per_sec
DIRECTION: maximize
TARGET: 1000
---
**HYPOTHESIS:** Wheel factorisation helps
**APPROACH:** wheel
KIND: sweep
PARAMETER: size
VALUES: 2, 6, 30
```python
print("METRIC speed", {{size}})
```
EVALUATION: metric_line
METRIC: speed
---
HYPOTHESIS: Program prints done
APPROACH: smoke
```python
print("done")
```
EXPECTED: done
)RESP";

analyst::ScoredOutcome FailedOutcome(const std::string& objective, const Hypothesis& hypothesis) {
    analyst::ScoredOutcome outcome{};
    outcome.id = analyst::MakeOutcomeId(hypothesis.id);
    outcome.hypothesis_id = hypothesis.id;
    outcome.objective = objective;
    outcome.description = hypothesis.description;
    outcome.approach = hypothesis.approach;
    outcome.code_hash = ProgramHash(hypothesis.program);
    outcome.classification = analyst::Classification::kFailure;
    outcome.insight = "did not work";
    return outcome;
}

TEST(ParseProposalsTest, ReadsEveryField) {
    const auto hypotheses = ParseProposals(kThreeProposals, "primes", 7);
    ASSERT_EQ(hypotheses.size(), 3u);

    const auto& sieve = hypotheses[0];
    EXPECT_EQ(sieve.description, "Sieve beats trial division");
    EXPECT_EQ(sieve.approach, "sieve");
    EXPECT_EQ(sieve.sequence, 7u);
    EXPECT_EQ(sieve.objective, "primes");
    EXPECT_FALSE(sieve.IsSweep());
    EXPECT_EQ(sieve.evaluation.kind, EvaluationKind::kJsonMetric);
    EXPECT_EQ(sieve.evaluation.metric, "primes_per_sec");
    ASSERT_TRUE(sieve.evaluation.target.has_value());
    EXPECT_DOUBLE_EQ(*sieve.evaluation.target, 1000.0);
    EXPECT_NE(RenderProgram(sieve).find("json.dumps"), std::string::npos);

    const auto& wheel = hypotheses[1];
    EXPECT_EQ(wheel.description, "Wheel factorisation helps");
    EXPECT_EQ(wheel.approach, "wheel");
    ASSERT_TRUE(wheel.IsSweep());
    const auto& sweep = std::get<ParameterSweep>(wheel.program);
    EXPECT_EQ(sweep.parameter, "size");
    EXPECT_EQ(sweep.values, (std::vector<std::string>{"2", "6", "30"}));
    EXPECT_EQ(wheel.evaluation.kind, EvaluationKind::kMetricLine);
    EXPECT_EQ(wheel.sequence, 8u);

    const auto& smoke = hypotheses[2];
    EXPECT_EQ(smoke.evaluation.kind, EvaluationKind::kOutputContains);
    EXPECT_EQ(smoke.evaluation.expected_text, "done");
}

TEST(ParseProposalsTest, SkipsBlocksWithoutCode) {
    const auto hypotheses = ParseProposals(
        "HYPOTHESIS: no program here\nAPPROACH: talk\n---\nAPPROACH: missing description\n```\nprint(1)\n```\n",
        "primes");
    EXPECT_TRUE(hypotheses.empty());
}

TEST(ParseProposalsTest, DefaultsToExitStatusWithoutMetric) {
    const auto hypotheses = ParseProposals("HYPOTHESIS: runs cleanly\n```\nprint(1)\n```\n", "primes");
    ASSERT_EQ(hypotheses.size(), 1u);
    EXPECT_EQ(hypotheses[0].evaluation.kind, EvaluationKind::kExitStatus);
}

TEST(ParseProposalsTest, SameProgramSameId) {
    const auto first = ParseProposals(kThreeProposals, "primes");
    const auto second = ParseProposals(kThreeProposals, "primes", 3);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].id, second[i].id);
    }
}

TEST(ExtractCodeBlocksTest, PrefersFencedBlocks) {
    const auto blocks = ExtractCodeBlocks("text\n```python\na = 1\n```\nmore\n```\nb = 2\n```\n");
    EXPECT_EQ(blocks, (std::vector<std::string>{"a = 1\n", "b = 2\n"}));
}

TEST(ExtractCodeBlocksTest, FallsBackToIndentedCode) {
    const auto blocks = ExtractCodeBlocks("Program:\n    x = 1\n    print(x)\nThat is all.\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0], "x = 1\nprint(x)\n");
}

TEST(HypothesisGeneratorTest, ProposesInOrderWithSequences) {
    auto backend = std::make_shared<ScriptedBackend>(kThreeProposals);
    HypothesisGenerator generator(backend, ResearcherSettings{.temperature = 0.3});
    const auto hypotheses = generator.Propose("primes", {}, {}, 2, 10);

    ASSERT_EQ(hypotheses.size(), 2u);
    EXPECT_EQ(hypotheses[0].approach, "sieve");
    EXPECT_EQ(hypotheses[0].sequence, 10u);
    EXPECT_EQ(hypotheses[1].approach, "wheel");
    EXPECT_EQ(hypotheses[1].sequence, 11u);
    EXPECT_EQ(backend->calls, 1);
    EXPECT_DOUBLE_EQ(backend->last_temperature, 0.3);
}

TEST(HypothesisGeneratorTest, DropsProgramsThatAlreadyFailed) {
    const auto parsed = ParseProposals(kThreeProposals, "primes");
    auto backend = std::make_shared<ScriptedBackend>(kThreeProposals);
    HypothesisGenerator generator(backend, ResearcherSettings{});

    const auto hypotheses = generator.Propose("primes", {}, {FailedOutcome("primes", parsed[0])}, 3);
    ASSERT_EQ(hypotheses.size(), 2u);
    for (const auto& hypothesis : hypotheses) {
        EXPECT_NE(hypothesis.id, parsed[0].id);
    }
}

TEST(HypothesisGeneratorTest, FailedApproachesGoLast) {
    auto failed = ParseProposals("HYPOTHESIS: other sieve\nAPPROACH: Sieve\n```\nprint(2)\n```\n", "primes");
    ASSERT_EQ(failed.size(), 1u);
    auto backend = std::make_shared<ScriptedBackend>(kThreeProposals);
    HypothesisGenerator generator(backend, ResearcherSettings{});

    const auto hypotheses = generator.Propose("primes", {}, {FailedOutcome("primes", failed[0])}, 3);
    ASSERT_EQ(hypotheses.size(), 3u);
    EXPECT_EQ(hypotheses[0].approach, "wheel");
    EXPECT_EQ(hypotheses[2].approach, "sieve");
    EXPECT_EQ(hypotheses[2].sequence, 2u);
}

TEST(HypothesisGeneratorTest, DropsDuplicatesAndNetworkPrograms) {
    const std::string response =
        "HYPOTHESIS: fetch data\n```\nimport requests\nprint(requests.get('http://x').text)\n```\n---\n"
        "HYPOTHESIS: local\n```\nprint(1)\n```\n---\n"
        "HYPOTHESIS: local again\n```\nprint(1)\n```\n";
    auto backend = std::make_shared<ScriptedBackend>(response);
    HypothesisGenerator generator(backend, ResearcherSettings{});

    const auto hypotheses = generator.Propose("primes", {}, {}, 3);
    ASSERT_EQ(hypotheses.size(), 1u);
    EXPECT_EQ(hypotheses[0].description, "local");
    EXPECT_EQ(hypotheses[0].sequence, 0u);
}

TEST(HypothesisGeneratorTest, KeepsLocalProgramsThatMentionCommandNames) {
    const std::string response =
        "HYPOTHESIS: pooled workers\n```\nfrom concurrent.futures import ThreadPoolExecutor\n"
        "ex = ThreadPoolExecutor(4)\nprint(sum(ex.map(abs, [-1, 2])))\nex.shutdown()\n```\n---\n"
        "HYPOTHESIS: counter\n```\n# compare ssh key hashing speeds\ninc = 3\nsync = inc - 1\nprint(sync)\n```\n";
    auto backend = std::make_shared<ScriptedBackend>(response);
    HypothesisGenerator generator(backend, ResearcherSettings{});
    const auto hypotheses = generator.Propose("primes", {}, {}, 2);
    ASSERT_EQ(hypotheses.size(), 2u);
    EXPECT_EQ(hypotheses[0].description, "pooled workers");
    EXPECT_EQ(hypotheses[1].description, "counter");
}

TEST(HypothesisGeneratorTest, NetworkProgramsAllowedWhenEnabled) {
    const std::string response = "HYPOTHESIS: fetch data\n```\nimport requests\n```\n";
    auto backend = std::make_shared<ScriptedBackend>(response);
    HypothesisGenerator generator(backend, ResearcherSettings{.network_allowed = true});
    EXPECT_EQ(generator.Propose("primes", {}, {}, 1).size(), 1u);
}

TEST(HypothesisGeneratorTest, ThrowsWhenNothingUsable) {
    auto prose = std::make_shared<ScriptedBackend>("I cannot think of anything.");
    HypothesisGenerator prose_generator(prose, ResearcherSettings{});
    EXPECT_THROW(prose_generator.Propose("primes", {}, {}, 3), utils::GenerationUnavailable);

    auto network = std::make_shared<ScriptedBackend>("HYPOTHESIS: fetch\n```\nimport socket\n```\n");
    HypothesisGenerator network_generator(network, ResearcherSettings{});
    EXPECT_THROW(network_generator.Propose("primes", {}, {}, 3), utils::GenerationUnavailable);

    HypothesisGenerator unconfigured(nullptr, ResearcherSettings{});
    EXPECT_THROW(unconfigured.Propose("primes", {}, {}, 3), utils::GenerationUnavailable);
}

TEST(HypothesisGeneratorTest, PromptCarriesKnowledgeAndHistory) {
    HypothesisGenerator generator(std::make_shared<ScriptedBackend>(""), ResearcherSettings{.language = "Python 3"});
    cognition::KnowledgeEntry entry{};
    entry.classification = analyst::Classification::kSuccess;
    entry.quality = 0.75;
    entry.insight = "segmented sieves stay in cache";
    const auto failed = ParseProposals("HYPOTHESIS: brute force\nAPPROACH: brute\n```\nprint(3)\n```\n", "primes");

    const auto prompt = generator.BuildPrompt("primes", {entry}, {FailedOutcome("primes", failed[0])}, 4);
    EXPECT_NE(prompt.find("Research Objective: primes"), std::string::npos);
    EXPECT_NE(prompt.find("segmented sieves stay in cache"), std::string::npos);
    EXPECT_NE(prompt.find("Failed approaches: brute"), std::string::npos);
    EXPECT_NE(prompt.find("Generate 4 specific"), std::string::npos);
    EXPECT_NE(prompt.find("Never access the network"), std::string::npos);
}

}  // namespace
}  // namespace autolab::researcher
