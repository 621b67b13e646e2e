#include "../include/promptgate/policy.hpp"

#include <stdexcept>
#include <utility>

namespace promptgate {

const char* verdict_name(Verdict verdict) noexcept {
    return verdict == Verdict::Block ? "block" : "allow";
}

DecisionPolicy::DecisionPolicy(PolicyConfig config)
    : m_config(std::move(config)) {
    if (!(m_config.threshold >= 0.0 && m_config.threshold <= 1.0)) {
        throw std::invalid_argument("policy threshold must lie in [0, 1]");
    }
}

GateDecision DecisionPolicy::decide(const ScoreOutcome& outcome) const {
    GateDecision decision;
    if (!outcome.scored()) {
        decision.verdict = m_config.fail_open ? Verdict::Allow : Verdict::Block;
        decision.reason = outcome.state == ScorerState::Failed ? "scoring-failed" : "classifier-unavailable";
        return decision;
    }

    decision.score = outcome.score;
    if (outcome.score >= m_config.threshold) {
        decision.verdict = Verdict::Block;
        decision.reason = "injection-detected";
        decision.injection_detected = true;
    } else {
        decision.verdict = Verdict::Allow;
        decision.reason = "below-threshold";
    }
    return decision;
}

Json DecisionPolicy::block_envelope(const GateDecision& decision) const {
    JsonObject envelope;
    envelope["error"] = Json(kBlockedError);
    envelope["message"] = Json(decision.injection_detected ? m_config.block_message : m_config.unavailable_message);
    return Json(envelope);
}

} // namespace promptgate
