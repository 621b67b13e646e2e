#pragma once

#include "classifier_provider.hpp"
#include "json.hpp"
#include "policy.hpp"
#include "scorer.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

namespace promptgate {

struct GateStats {
    std::uint64_t evaluated = 0;
    std::uint64_t allowed = 0;
    std::uint64_t blocked = 0;
    std::uint64_t unavailable = 0;
    std::uint64_t scoring_failures = 0;
    // Subsets of scoring_failures.
    std::uint64_t invalid_token = 0;
    std::uint64_t timeouts = 0;

    Json to_json() const;
};

struct GateOutcome {
    GateDecision decision;
    ScorerState scorer_state = ScorerState::Unavailable;
    std::optional<ClassifierFault> fault;
    Json payload;
};

// Filter applied to every outbound tool result. Safe to call concurrently.
class ResponseGate {
public:
    ResponseGate(ClassifierProviderPtr provider, DecisionPolicy policy, bool log_payloads = false);
    ResponseGate(const ResponseGate&) = delete;
    ResponseGate& operator=(const ResponseGate&) = delete;

    // Returns the payload untouched when allowed, or the block envelope.
    Json gate(Json payload);

    GateOutcome inspect(Json payload);

    GateStats stats() const;
    Json status() const;

    const DecisionPolicy& policy() const noexcept { return m_policy; }

private:
    ScorerAdapter m_scorer;
    DecisionPolicy m_policy;
    bool m_log_payloads;

    std::atomic<std::uint64_t> m_evaluated{0};
    std::atomic<std::uint64_t> m_allowed{0};
    std::atomic<std::uint64_t> m_blocked{0};
    std::atomic<std::uint64_t> m_unavailable{0};
    std::atomic<std::uint64_t> m_scoring_failures{0};
    std::atomic<std::uint64_t> m_invalid_token{0};
    std::atomic<std::uint64_t> m_timeouts{0};

    void record(const GateDecision& decision, const ScoreOutcome& outcome, const Json& payload, std::size_t text_size);
};

} // namespace promptgate
