#pragma once

#include "classifier_provider.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace promptgate {

enum class ScorerState {
    Scored,
    Unavailable,
    Failed
};

struct ScoreOutcome {
    ScorerState state = ScorerState::Unavailable;
    double score = 0.0;
    std::string error;
    // Cause of a Failed outcome.
    std::optional<ClassifierFault> fault;

    bool scored() const noexcept { return state == ScorerState::Scored; }
};

const char* scorer_state_name(ScorerState state) noexcept;

// Boundary around the classifier: load and inference errors come back as
// Unavailable or Failed outcomes, never as exceptions.
class ScorerAdapter {
public:
    explicit ScorerAdapter(ClassifierProviderPtr provider);
    ScorerAdapter(const ScorerAdapter&) = delete;
    ScorerAdapter& operator=(const ScorerAdapter&) = delete;

    ScoreOutcome score(const std::string& text);

    const ClassifierProviderPtr& provider() const noexcept { return m_provider; }

private:
    ClassifierProviderPtr m_provider;
    std::mutex m_serial_mutex;
};

} // namespace promptgate
