#pragma once

#include "log.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace promptgate {

enum class BackendKind {
    Local,
    Remote
};

struct GateConfig {
    BackendKind backend = BackendKind::Local;
    std::filesystem::path cache_root;
    std::string model_id = "meta-llama/Llama-Prompt-Guard-2-86M";

    double threshold = 0.5;
    std::string block_message = "PromptGuard detected a potential jailbreak attempt in the response.";
    bool fail_open = true;

    std::string remote_endpoint;
    std::string remote_token;
    long remote_timeout_ms = 10000;

    LogLevel log_level = LogLevel::Info;
    bool log_payloads = false;

    std::filesystem::path artifact_path() const { return cache_root / model_id; }
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> read_env(const char* name);

GateConfig resolve_gate_config();
GateConfig resolve_gate_config(const EnvLookup& lookup);

std::optional<BackendKind> parse_backend_kind(const std::string& name);
std::string backend_kind_to_string(BackendKind kind);

} // namespace promptgate
