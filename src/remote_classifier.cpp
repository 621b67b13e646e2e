#include "../include/promptgate/classifier.hpp"
#include "../include/promptgate/net/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace promptgate {

namespace {

constexpr std::array<const char*, 4> kInjectionLabels = {"LABEL_1", "MALICIOUS", "JAILBREAK", "INJECTION"};
constexpr std::array<const char*, 2> kBenignLabels = {"LABEL_0", "BENIGN"};

std::string uppercase(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

ClassifierFault fault_for(net::HttpFailure failure) noexcept {
    switch (failure) {
    case net::HttpFailure::Unauthorized: return ClassifierFault::InvalidToken;
    case net::HttpFailure::Timeout: return ClassifierFault::Timeout;
    case net::HttpFailure::Transport: return ClassifierFault::Unreachable;
    case net::HttpFailure::Status: return ClassifierFault::BadResponse;
    }
    return ClassifierFault::Inference;
}

template <std::size_t N>
bool contains_label(const std::array<const char*, N>& labels, const std::string& label) {
    return std::any_of(labels.begin(), labels.end(), [&](const char* candidate) { return label == candidate; });
}

class RemoteClassifier final : public Classifier {
public:
    RemoteClassifier(std::string endpoint, std::string token, long timeout_ms)
        : m_endpoint(std::move(endpoint)), m_token(std::move(token)), m_timeout_ms(timeout_ms) {}

    double score(const std::string& text) override {
        JsonObject payload;
        payload["inputs"] = Json(text);

        net::Headers headers;
        headers.emplace_back("Authorization", "Bearer " + m_token);

        std::string response;
        try {
            response = net::post_json(m_endpoint, Json(payload).dump(), headers, m_timeout_ms);
        } catch (const net::HttpError& ex) {
            throw ClassifierError(fault_for(ex.failure()), ex.what());
        }

        Json document;
        try {
            document = Json::parse(response);
        } catch (const std::exception& ex) {
            throw ClassifierError(ClassifierFault::BadResponse, std::string("inference response is not JSON: ") + ex.what());
        }
        const std::optional<double> score = extract_injection_score(document);
        if (!score) {
            throw ClassifierError(ClassifierFault::BadResponse, "inference response carries no injection label");
        }
        return *score;
    }

    std::string describe() const override {
        return "remote(" + m_endpoint + ")";
    }

private:
    std::string m_endpoint;
    std::string m_token;
    long m_timeout_ms;
};

} // namespace

const char* classifier_fault_name(ClassifierFault fault) noexcept {
    switch (fault) {
    case ClassifierFault::Inference: return "inference";
    case ClassifierFault::InvalidScore: return "invalid-score";
    case ClassifierFault::InvalidToken: return "invalid-token";
    case ClassifierFault::Timeout: return "timeout";
    case ClassifierFault::Unreachable: return "unreachable";
    case ClassifierFault::BadResponse: return "bad-response";
    }
    return "inference";
}

std::optional<double> extract_injection_score(const Json& response) {
    if (!response.is_array()) {
        return std::nullopt;
    }
    const JsonArray* entries = &response.as_array();
    if (!entries->empty() && entries->front().is_array()) {
        entries = &entries->front().as_array();
    }

    std::optional<double> benign;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            continue;
        }
        const auto& obj = entry.as_object();
        const auto label_it = obj.find("label");
        const auto score_it = obj.find("score");
        if (label_it == obj.end() || !label_it->second.is_string()
            || score_it == obj.end() || !score_it->second.is_number()) {
            continue;
        }
        const std::string label = uppercase(label_it->second.as_string());
        if (contains_label(kInjectionLabels, label)) {
            return score_it->second.as_number();
        }
        if (contains_label(kBenignLabels, label)) {
            benign = score_it->second.as_number();
        }
    }
    if (benign) {
        return 1.0 - *benign;
    }
    return std::nullopt;
}

ClassifierPtr make_remote_classifier(std::string endpoint, std::string token, long timeout_ms) {
    if (endpoint.empty()) {
        throw std::runtime_error("remote classifier requires an endpoint");
    }
    if (token.empty()) {
        throw std::runtime_error("remote classifier requires an API token");
    }
    return std::make_shared<RemoteClassifier>(std::move(endpoint), std::move(token), timeout_ms);
}

} // namespace promptgate
