#include <catch2/catch.hpp>

#include "promptgate/policy.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace promptgate;

namespace {

ScoreOutcome scored(double value) {
    ScoreOutcome outcome;
    outcome.state = ScorerState::Scored;
    outcome.score = value;
    return outcome;
}

ScoreOutcome with_state(ScorerState state) {
    ScoreOutcome outcome;
    outcome.state = state;
    return outcome;
}

} // namespace

TEST_CASE("Policy blocks at or above the threshold", "[policy]") {
    const DecisionPolicy policy;
    REQUIRE(policy.decide(scored(0.5)).blocked());
    REQUIRE(policy.decide(scored(0.99)).blocked());
    REQUIRE_FALSE(policy.decide(scored(0.4999)).blocked());
    REQUIRE_FALSE(policy.decide(scored(0.0)).blocked());

    const GateDecision decision = policy.decide(scored(0.73));
    REQUIRE(decision.reason == "injection-detected");
    REQUIRE(decision.score.value() == Approx(0.73));
}

TEST_CASE("Policy fails open by default", "[policy]") {
    const DecisionPolicy policy;
    const GateDecision unavailable = policy.decide(with_state(ScorerState::Unavailable));
    REQUIRE_FALSE(unavailable.blocked());
    REQUIRE(unavailable.reason == "classifier-unavailable");
    REQUIRE_FALSE(unavailable.score.has_value());

    const GateDecision failed = policy.decide(with_state(ScorerState::Failed));
    REQUIRE_FALSE(failed.blocked());
    REQUIRE(failed.reason == "scoring-failed");
}

TEST_CASE("Fail-closed policy blocks when the scorer is unavailable", "[policy]") {
    PolicyConfig config;
    config.fail_open = false;
    const DecisionPolicy policy(config);

    const GateDecision decision = policy.decide(with_state(ScorerState::Unavailable));
    REQUIRE(decision.blocked());
    REQUIRE(policy.block_envelope(decision)
            == Json::parse(R"({"error":"Request failed: Blocked","message":"PromptGuard unavailable -- blocking data"})"));
}

TEST_CASE("Block envelope carries the detection notice", "[policy]") {
    const DecisionPolicy policy;
    const Json envelope = policy.block_envelope(policy.decide(scored(0.9)));
    REQUIRE(envelope == promptgate::testing::block_envelope());
    REQUIRE(envelope.dump() == R"({"error":"Request failed: Blocked","message":"PromptGuard detected a potential jailbreak attempt in the response."})");
}

TEST_CASE("Envelope notice follows the detection, not the presence of a score", "[policy]") {
    const DecisionPolicy policy;
    REQUIRE(policy.decide(scored(0.9)).injection_detected);
    REQUIRE_FALSE(policy.decide(scored(0.1)).injection_detected);

    GateDecision scored_but_clean;
    scored_but_clean.verdict = Verdict::Block;
    scored_but_clean.reason = "scoring-failed";
    scored_but_clean.score = 0.2;
    REQUIRE(policy.block_envelope(scored_but_clean).as_object().at("message").as_string()
            == "PromptGuard unavailable -- blocking data");
}

TEST_CASE("Policy threshold and message are configurable", "[policy]") {
    PolicyConfig config;
    config.threshold = 0.9;
    config.block_message = "Blocked by content filter.";
    const DecisionPolicy policy(config);
    REQUIRE_FALSE(policy.decide(scored(0.6)).blocked());
    const GateDecision decision = policy.decide(scored(0.95));
    REQUIRE(policy.block_envelope(decision).as_object().at("message").as_string() == "Blocked by content filter.");

    config.threshold = 1.2;
    REQUIRE_THROWS_AS(DecisionPolicy(config), std::invalid_argument);
}
