#include "../include/promptgate/gate.hpp"
#include "../include/promptgate/log.hpp"
#include "../include/promptgate/serializer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace promptgate {

namespace {

constexpr const char* kComponent = "gate";

} // namespace

Json GateStats::to_json() const {
    JsonObject obj;
    obj["evaluated"] = Json(static_cast<double>(evaluated));
    obj["allowed"] = Json(static_cast<double>(allowed));
    obj["blocked"] = Json(static_cast<double>(blocked));
    obj["unavailable"] = Json(static_cast<double>(unavailable));
    obj["scoring_failures"] = Json(static_cast<double>(scoring_failures));
    obj["invalid_token"] = Json(static_cast<double>(invalid_token));
    obj["timeouts"] = Json(static_cast<double>(timeouts));
    return Json(obj);
}

ResponseGate::ResponseGate(ClassifierProviderPtr provider, DecisionPolicy policy, bool log_payloads)
    : m_scorer(std::move(provider)), m_policy(std::move(policy)), m_log_payloads(log_payloads) {}

Json ResponseGate::gate(Json payload) {
    return inspect(std::move(payload)).payload;
}

GateOutcome ResponseGate::inspect(Json payload) {
    const std::string text = serialize_payload(payload);
    const ScoreOutcome outcome = m_scorer.score(text);

    GateOutcome result;
    result.decision = m_policy.decide(outcome);
    result.scorer_state = outcome.state;
    result.fault = outcome.fault;

    record(result.decision, outcome, payload, text.size());

    if (result.decision.blocked()) {
        result.payload = m_policy.block_envelope(result.decision);
    } else {
        result.payload = std::move(payload);
    }
    return result;
}

void ResponseGate::record(const GateDecision& decision, const ScoreOutcome& outcome, const Json& payload, std::size_t text_size) {
    ++m_evaluated;
    if (decision.blocked()) {
        ++m_blocked;
    } else {
        ++m_allowed;
    }
    if (outcome.state == ScorerState::Unavailable) {
        ++m_unavailable;
    } else if (outcome.state == ScorerState::Failed) {
        ++m_scoring_failures;
        const ClassifierFault fault = outcome.fault.value_or(ClassifierFault::Inference);
        if (fault == ClassifierFault::InvalidToken) {
            ++m_invalid_token;
        } else if (fault == ClassifierFault::Timeout) {
            ++m_timeouts;
        }
        log_line(LogLevel::Warn, kComponent,
                 std::string("scoring failed (") + classifier_fault_name(fault) + "), treating classifier as unavailable: " + outcome.error);
    }

    const LogLevel level = decision.blocked() ? LogLevel::Info : LogLevel::Debug;
    if (!log_enabled(level)) {
        return;
    }
    std::ostringstream oss;
    oss << verdict_name(decision.verdict) << " reason=" << decision.reason
        << " scorer=" << scorer_state_name(outcome.state);
    if (decision.score) {
        oss << " score=" << std::fixed << std::setprecision(4) << *decision.score;
    }
    oss << " bytes=" << text_size;
    // Blocked content never reaches the log.
    if (m_log_payloads && !decision.blocked()) {
        oss << " payload=" << payload.dump();
    }
    log_line(level, kComponent, oss.str());
}

GateStats ResponseGate::stats() const {
    GateStats snapshot;
    snapshot.evaluated = m_evaluated.load();
    snapshot.allowed = m_allowed.load();
    snapshot.blocked = m_blocked.load();
    snapshot.unavailable = m_unavailable.load();
    snapshot.scoring_failures = m_scoring_failures.load();
    snapshot.invalid_token = m_invalid_token.load();
    snapshot.timeouts = m_timeouts.load();
    return snapshot;
}

Json ResponseGate::status() const {
    JsonObject obj;
    obj["classifier"] = m_scorer.provider()->describe();
    obj["threshold"] = Json(m_policy.config().threshold);
    obj["fail_open"] = Json(m_policy.config().fail_open);
    obj["block_message"] = Json(m_policy.config().block_message);
    return Json(obj);
}

} // namespace promptgate
