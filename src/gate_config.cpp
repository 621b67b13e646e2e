#include "../include/promptgate/gate_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace promptgate {

namespace {

constexpr const char* kDefaultCacheNamespace = "promptgate";
constexpr const char* kRouterBase = "https://router.huggingface.co/hf-inference/models/";

std::string lowercase(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::optional<bool> parse_bool(const std::string& raw) {
    const std::string value = lowercase(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

void warn_ignored(const char* name, const std::string& value) {
    log_line(LogLevel::Warn, "config", std::string("ignoring invalid ") + name + "=" + value);
}

std::filesystem::path default_cache_root(const EnvLookup& lookup) {
    if (auto home = lookup("HOME"); home && !home->empty()) {
        return std::filesystem::path(*home) / ".cache" / kDefaultCacheNamespace;
    }
#ifdef _WIN32
    if (auto profile = lookup("USERPROFILE"); profile && !profile->empty()) {
        return std::filesystem::path(*profile) / ".cache" / kDefaultCacheNamespace;
    }
#endif
    return std::filesystem::path(".cache") / kDefaultCacheNamespace;
}

} // namespace

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::optional<BackendKind> parse_backend_kind(const std::string& name) {
    const std::string lowered = lowercase(name);
    if (lowered == "local") return BackendKind::Local;
    if (lowered == "remote" || lowered == "huggingface" || lowered == "hf") return BackendKind::Remote;
    return std::nullopt;
}

std::string backend_kind_to_string(BackendKind kind) {
    switch (kind) {
    case BackendKind::Local: return "local";
    case BackendKind::Remote: return "remote";
    }
    return "unknown";
}

GateConfig resolve_gate_config() {
    return resolve_gate_config(&read_env);
}

GateConfig resolve_gate_config(const EnvLookup& lookup) {
    GateConfig config;

    if (auto level = lookup("PROMPTGATE_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*level)) {
            config.log_level = *parsed;
        } else {
            warn_ignored("PROMPTGATE_LOG_LEVEL", *level);
        }
    }

    if (auto backend = lookup("PROMPTGATE_BACKEND")) {
        if (auto parsed = parse_backend_kind(*backend)) {
            config.backend = *parsed;
        } else {
            warn_ignored("PROMPTGATE_BACKEND", *backend);
        }
    }

    auto cache_dir = lookup("PROMPTGATE_CACHE_DIR");
    config.cache_root = cache_dir && !cache_dir->empty() ? std::filesystem::path(*cache_dir) : default_cache_root(lookup);

    if (auto model = lookup("PROMPTGATE_MODEL_ID"); model && !model->empty()) {
        config.model_id = *model;
    }

    if (auto threshold = lookup("PROMPTGATE_THRESHOLD")) {
        try {
            std::size_t consumed = 0;
            const double value = std::stod(*threshold, &consumed);
            if (consumed == threshold->size() && value >= 0.0 && value <= 1.0) {
                config.threshold = value;
            } else {
                warn_ignored("PROMPTGATE_THRESHOLD", *threshold);
            }
        } catch (const std::exception&) {
            warn_ignored("PROMPTGATE_THRESHOLD", *threshold);
        }
    }

    if (auto message = lookup("PROMPTGATE_BLOCK_MESSAGE"); message && !message->empty()) {
        config.block_message = *message;
    }

    if (auto fail_open = lookup("PROMPTGATE_FAIL_OPEN")) {
        if (auto parsed = parse_bool(*fail_open)) {
            config.fail_open = *parsed;
        } else {
            warn_ignored("PROMPTGATE_FAIL_OPEN", *fail_open);
        }
    }

    if (auto log_payloads = lookup("PROMPTGATE_LOG_PAYLOADS")) {
        if (auto parsed = parse_bool(*log_payloads)) {
            config.log_payloads = *parsed;
        } else {
            warn_ignored("PROMPTGATE_LOG_PAYLOADS", *log_payloads);
        }
    }

    if (auto endpoint = lookup("PROMPTGATE_HF_ENDPOINT"); endpoint && !endpoint->empty()) {
        config.remote_endpoint = *endpoint;
    } else {
        config.remote_endpoint = std::string(kRouterBase) + config.model_id;
    }

    if (auto token = lookup("HUGGINGFACE_API_TOKEN")) {
        config.remote_token = *token;
    }

    if (auto timeout = lookup("PROMPTGATE_MODEL_TIMEOUT_MS")) {
        char* end = nullptr;
        const long candidate = std::strtol(timeout->c_str(), &end, 10);
        if (end != timeout->c_str() && *end == '\0' && candidate > 0) {
            config.remote_timeout_ms = candidate;
        } else {
            warn_ignored("PROMPTGATE_MODEL_TIMEOUT_MS", *timeout);
        }
    }

    return config;
}

} // namespace promptgate
