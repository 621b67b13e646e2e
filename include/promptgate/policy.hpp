#pragma once

#include "json.hpp"
#include "scorer.hpp"

#include <optional>
#include <string>

namespace promptgate {

inline constexpr const char* kBlockedError = "Request failed: Blocked";

struct PolicyConfig {
    double threshold = 0.5;
    std::string block_message = "PromptGuard detected a potential jailbreak attempt in the response.";
    std::string unavailable_message = "PromptGuard unavailable -- blocking data";
    bool fail_open = true;
};

enum class Verdict {
    Allow,
    Block
};

struct GateDecision {
    Verdict verdict = Verdict::Allow;
    std::string reason;
    std::optional<double> score;
    // Set only when the score reached the threshold.
    bool injection_detected = false;

    bool blocked() const noexcept { return verdict == Verdict::Block; }
};

const char* verdict_name(Verdict verdict) noexcept;

class DecisionPolicy {
public:
    DecisionPolicy() = default;
    explicit DecisionPolicy(PolicyConfig config);

    GateDecision decide(const ScoreOutcome& outcome) const;

    // Replacement body for a blocked payload.
    Json block_envelope(const GateDecision& decision) const;

    const PolicyConfig& config() const noexcept { return m_config; }

private:
    PolicyConfig m_config;
};

} // namespace promptgate
