#include "../include/promptgate/classifier.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace promptgate {

namespace {

constexpr const char* kModelFileName = "classifier.json";
constexpr const char* kModelFormat = "lexicon-logistic";
constexpr std::size_t kMaxNgram = 8;

std::string canonicalise_apostrophes(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (ch == 0xE2 && i + 2 < text.size()) {
            const unsigned char next1 = static_cast<unsigned char>(text[i + 1]);
            const unsigned char next2 = static_cast<unsigned char>(text[i + 2]);
            if (next1 == 0x80 && (next2 == 0x98 || next2 == 0x99)) {
                result.push_back('\'');
                i += 3;
                continue;
            }
        }
        result.push_back(static_cast<char>(ch));
        ++i;
    }
    return result;
}

bool is_word_byte(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '\'' || ch >= 0x80;
}

double sigmoid(double z) {
    return 1.0 / (1.0 + std::exp(-z));
}

class LexiconClassifier final : public Classifier {
public:
    LexiconClassifier(LexiconModel model, std::string origin)
        : m_model(std::move(model)), m_origin(std::move(origin)) {}

    double score(const std::string& text) override {
        const std::vector<std::string> words = split_words(text, m_model.lowercase);
        std::unordered_set<std::string> matched;
        double z = m_model.intercept;
        for (std::size_t n = 1; n <= m_model.max_ngram; ++n) {
            if (words.size() < n) {
                break;
            }
            for (std::size_t start = 0; start + n <= words.size(); ++start) {
                std::string gram = words[start];
                for (std::size_t k = 1; k < n; ++k) {
                    gram.push_back(' ');
                    gram += words[start + k];
                }
                const auto it = m_model.features.find(gram);
                if (it != m_model.features.end() && matched.insert(gram).second) {
                    z += it->second;
                }
            }
        }
        return sigmoid(z);
    }

    std::string describe() const override {
        std::ostringstream oss;
        oss << "lexicon(" << m_model.features.size() << " features, max_ngram=" << m_model.max_ngram << ")";
        if (!m_origin.empty()) {
            oss << " from " << m_origin;
        }
        return oss.str();
    }

private:
    LexiconModel m_model;
    std::string m_origin;
};

} // namespace

std::vector<std::string> split_words(std::string_view text, bool lowercase) {
    const std::string canonical = canonicalise_apostrophes(text);
    std::vector<std::string> words;
    std::string current;
    for (char c : canonical) {
        const unsigned char ch = static_cast<unsigned char>(c);
        if (is_word_byte(ch)) {
            current.push_back(lowercase && ch < 0x80 ? static_cast<char>(std::tolower(ch)) : c);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

LexiconModel parse_lexicon_model(const Json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("lexicon model must be a JSON object");
    }
    const auto& obj = document.as_object();
    LexiconModel model;

    if (auto it = obj.find("format"); it != obj.end()) {
        if (!it->second.is_string() || it->second.as_string() != kModelFormat) {
            throw std::runtime_error("unsupported classifier format");
        }
    }
    if (auto it = obj.find("lowercase"); it != obj.end()) {
        if (!it->second.is_bool()) {
            throw std::runtime_error("lexicon model: lowercase must be a boolean");
        }
        model.lowercase = it->second.as_bool();
    }
    if (auto it = obj.find("max_ngram"); it != obj.end()) {
        if (!it->second.is_number()) {
            throw std::runtime_error("lexicon model: max_ngram must be a number");
        }
        const double value = it->second.as_number();
        if (value < 1.0 || value > static_cast<double>(kMaxNgram) || std::trunc(value) != value) {
            throw std::runtime_error("lexicon model: max_ngram out of range");
        }
        model.max_ngram = static_cast<std::size_t>(value);
    }
    if (auto it = obj.find("intercept"); it != obj.end()) {
        if (!it->second.is_number() || !std::isfinite(it->second.as_number())) {
            throw std::runtime_error("lexicon model: intercept must be a finite number");
        }
        model.intercept = it->second.as_number();
    }

    const auto features_it = obj.find("features");
    if (features_it == obj.end() || !features_it->second.is_object()) {
        throw std::runtime_error("lexicon model: missing features object");
    }
    for (const auto& [phrase, weight] : features_it->second.as_object()) {
        if (!weight.is_number() || !std::isfinite(weight.as_number())) {
            throw std::runtime_error("lexicon model: weight for '" + phrase + "' must be a finite number");
        }
        std::vector<std::string> words = split_words(phrase, model.lowercase);
        if (words.empty() || words.size() > model.max_ngram) {
            throw std::runtime_error("lexicon model: feature '" + phrase + "' does not fit max_ngram");
        }
        std::string key = words.front();
        for (std::size_t i = 1; i < words.size(); ++i) {
            key.push_back(' ');
            key += words[i];
        }
        model.features[key] += weight.as_number();
    }
    return model;
}

ClassifierPtr make_lexicon_classifier(LexiconModel model, std::string origin) {
    return std::make_shared<LexiconClassifier>(std::move(model), std::move(origin));
}

ClassifierPtr load_lexicon_classifier(const std::filesystem::path& artifact) {
    std::filesystem::path file = artifact;
    if (std::filesystem::is_directory(artifact)) {
        file = artifact / kModelFileName;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("unable to open classifier model " + file.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    Json document = Json::parse(buffer.str());
    return make_lexicon_classifier(parse_lexicon_model(document), file.string());
}

} // namespace promptgate
