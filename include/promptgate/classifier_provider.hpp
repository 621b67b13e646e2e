#pragma once

#include "classifier.hpp"
#include "gate_config.hpp"
#include "json.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace promptgate {

// Decides, per call, whether a classifier can be used and hands out the
// process-wide handle. Built once at startup and shared by every handler.
struct ClassifierProvider {
    virtual ~ClassifierProvider() = default;

    // Handle for this call, or nullptr when the classifier is unavailable.
    virtual ClassifierPtr acquire() = 0;

    virtual Json describe() const = 0;
};

using ClassifierProviderPtr = std::shared_ptr<ClassifierProvider>;

// Identifies one version of an on-disk artifact: newest write time, byte
// count and entry count over the path and, for a directory, everything in it.
struct ArtifactStamp {
    std::filesystem::file_time_type newest_write{};
    std::uintmax_t total_size = 0;
    std::size_t entries = 0;

    bool operator==(const ArtifactStamp& other) const {
        return newest_write == other.newest_write && total_size == other.total_size && entries == other.entries;
    }
};

// Availability follows the artifact on disk: it is checked on every call,
// and the handle is loaded once, on the first call that finds it.
class LocalClassifierProvider final : public ClassifierProvider {
public:
    using Loader = std::function<ClassifierPtr(const std::filesystem::path&)>;

    explicit LocalClassifierProvider(std::filesystem::path artifact, Loader loader = &load_lexicon_classifier);
    LocalClassifierProvider(const LocalClassifierProvider&) = delete;
    LocalClassifierProvider& operator=(const LocalClassifierProvider&) = delete;

    ClassifierPtr acquire() override;
    Json describe() const override;

    const std::filesystem::path& artifact_path() const noexcept { return m_artifact; }
    std::size_t load_attempts() const noexcept { return m_load_attempts.load(); }

private:
    std::filesystem::path m_artifact;
    Loader m_loader;
    mutable std::mutex m_mutex;
    ClassifierPtr m_handle;
    std::optional<ArtifactStamp> m_failed_stamp;
    std::atomic<std::size_t> m_load_attempts{0};

    bool artifact_present() const;
};

class RemoteClassifierProvider final : public ClassifierProvider {
public:
    RemoteClassifierProvider(std::string endpoint, std::string token, long timeout_ms);
    RemoteClassifierProvider(const RemoteClassifierProvider&) = delete;
    RemoteClassifierProvider& operator=(const RemoteClassifierProvider&) = delete;

    ClassifierPtr acquire() override;
    Json describe() const override;

private:
    std::string m_endpoint;
    std::string m_token;
    long m_timeout_ms;
    std::once_flag m_once;
    ClassifierPtr m_handle;
};

ClassifierProviderPtr make_classifier_provider(const GateConfig& config);

} // namespace promptgate
