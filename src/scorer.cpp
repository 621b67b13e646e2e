#include "../include/promptgate/scorer.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace promptgate {

const char* scorer_state_name(ScorerState state) noexcept {
    switch (state) {
    case ScorerState::Scored: return "scored";
    case ScorerState::Unavailable: return "unavailable";
    case ScorerState::Failed: return "failed";
    }
    return "unavailable";
}

ScorerAdapter::ScorerAdapter(ClassifierProviderPtr provider)
    : m_provider(std::move(provider)) {
    if (!m_provider) {
        throw std::invalid_argument("ScorerAdapter requires a classifier provider");
    }
}

ScoreOutcome ScorerAdapter::score(const std::string& text) {
    ScoreOutcome outcome;

    ClassifierPtr classifier;
    try {
        classifier = m_provider->acquire();
    } catch (const std::exception& ex) {
        outcome.state = ScorerState::Unavailable;
        outcome.error = ex.what();
        return outcome;
    }
    if (!classifier) {
        outcome.state = ScorerState::Unavailable;
        return outcome;
    }

    double value = 0.0;
    try {
        if (classifier->reentrant()) {
            value = classifier->score(text);
        } else {
            std::scoped_lock lock(m_serial_mutex);
            value = classifier->score(text);
        }
    } catch (const ClassifierError& ex) {
        outcome.state = ScorerState::Failed;
        outcome.fault = ex.fault();
        outcome.error = ex.what();
        return outcome;
    } catch (const std::exception& ex) {
        outcome.state = ScorerState::Failed;
        outcome.fault = ClassifierFault::Inference;
        outcome.error = ex.what();
        return outcome;
    }

    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        std::ostringstream oss;
        oss << "score out of range: " << value;
        outcome.state = ScorerState::Failed;
        outcome.fault = ClassifierFault::InvalidScore;
        outcome.error = oss.str();
        return outcome;
    }

    outcome.state = ScorerState::Scored;
    outcome.score = value;
    return outcome;
}

} // namespace promptgate
