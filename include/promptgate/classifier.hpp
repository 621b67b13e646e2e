#pragma once

#include "json.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptgate {

// A loaded injection scorer. Instances are shared across concurrent gate
// calls once built.
struct Classifier {
    virtual ~Classifier() = default;

    // Estimated probability in [0, 1] that the text carries an injection
    // attempt. May throw on inference failure.
    virtual double score(const std::string& text) = 0;

    // False when concurrent score() calls must be serialized by the caller.
    virtual bool reentrant() const noexcept { return true; }

    virtual std::string describe() const = 0;
};

using ClassifierPtr = std::shared_ptr<Classifier>;

enum class ClassifierFault {
    Inference,
    InvalidScore,
    InvalidToken,
    Timeout,
    Unreachable,
    BadResponse
};

const char* classifier_fault_name(ClassifierFault fault) noexcept;

// Inference failure with a cause the gate reports apart from generic errors.
class ClassifierError : public std::runtime_error {
public:
    ClassifierError(ClassifierFault fault, const std::string& message)
        : std::runtime_error(message), m_fault(fault) {}

    ClassifierFault fault() const noexcept { return m_fault; }

private:
    ClassifierFault m_fault;
};

struct LexiconModel {
    bool lowercase = true;
    std::size_t max_ngram = 1;
    double intercept = 0.0;
    std::unordered_map<std::string, double> features;
};

std::vector<std::string> split_words(std::string_view text, bool lowercase);

LexiconModel parse_lexicon_model(const Json& document);

// Accepts either the model directory (reads classifier.json inside it) or
// the JSON file itself. Throws std::runtime_error when the artifact cannot
// be read or is malformed.
ClassifierPtr load_lexicon_classifier(const std::filesystem::path& artifact);

ClassifierPtr make_lexicon_classifier(LexiconModel model, std::string origin = std::string());

// Reduces a text-classification response ([[{label, score}, ...]] or the
// flat list) to the injection probability.
std::optional<double> extract_injection_score(const Json& response);

ClassifierPtr make_remote_classifier(std::string endpoint, std::string token, long timeout_ms);

} // namespace promptgate
