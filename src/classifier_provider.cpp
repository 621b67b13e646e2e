#include "../include/promptgate/classifier_provider.hpp"
#include "../include/promptgate/log.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace promptgate {

namespace {

constexpr const char* kComponent = "classifier";

void fold_entry(const std::filesystem::directory_entry& entry, ArtifactStamp& stamp, std::error_code& ec) {
    const auto written = entry.last_write_time(ec);
    if (ec) {
        return;
    }
    if (stamp.entries == 0 || written > stamp.newest_write) {
        stamp.newest_write = written;
    }
    ++stamp.entries;
    if (entry.is_regular_file(ec) && !ec) {
        const auto size = entry.file_size(ec);
        if (!ec) {
            stamp.total_size += size;
        }
    }
}

// Covers the files inside a directory artifact as well, since rewriting a
// model file in place leaves the directory's own timestamp alone.
std::optional<ArtifactStamp> stamp_of(const std::filesystem::path& path) {
    std::error_code ec;
    ArtifactStamp stamp;
    const std::filesystem::directory_entry root(path, ec);
    if (ec) {
        return std::nullopt;
    }
    fold_entry(root, stamp, ec);
    if (ec) {
        return std::nullopt;
    }
    if (std::filesystem::is_directory(path, ec)) {
        std::filesystem::recursive_directory_iterator it(path, ec);
        const std::filesystem::recursive_directory_iterator end;
        while (!ec && it != end) {
            fold_entry(*it, stamp, ec);
            if (!ec) {
                it.increment(ec);
            }
        }
    }
    if (ec) {
        return std::nullopt;
    }
    return stamp;
}

} // namespace

LocalClassifierProvider::LocalClassifierProvider(std::filesystem::path artifact, Loader loader)
    : m_artifact(std::move(artifact)), m_loader(std::move(loader)) {
    if (!m_loader) {
        throw std::invalid_argument("LocalClassifierProvider requires a loader");
    }
}

bool LocalClassifierProvider::artifact_present() const {
    std::error_code ec;
    const bool present = std::filesystem::exists(m_artifact, ec);
    return present && !ec;
}

ClassifierPtr LocalClassifierProvider::acquire() {
    if (!artifact_present()) {
        return nullptr;
    }

    std::scoped_lock lock(m_mutex);
    if (m_handle) {
        return m_handle;
    }

    const auto stamp = stamp_of(m_artifact);
    if (m_failed_stamp && stamp && *m_failed_stamp == *stamp) {
        return nullptr;
    }

    ++m_load_attempts;
    try {
        m_handle = m_loader(m_artifact);
    } catch (const std::exception& ex) {
        m_failed_stamp = stamp;
        log_line(LogLevel::Warn, kComponent, "failed to load " + m_artifact.string() + ": " + ex.what());
        return nullptr;
    }
    if (!m_handle) {
        m_failed_stamp = stamp;
        log_line(LogLevel::Warn, kComponent, "loader returned no classifier for " + m_artifact.string());
        return nullptr;
    }
    m_failed_stamp.reset();
    log_line(LogLevel::Info, kComponent, "loaded " + m_handle->describe());
    return m_handle;
}

Json LocalClassifierProvider::describe() const {
    JsonObject info;
    info["backend"] = Json("local");
    info["artifact_path"] = Json(m_artifact.string());
    info["artifact_present"] = Json(artifact_present());
    {
        std::scoped_lock lock(m_mutex);
        info["loaded"] = Json(static_cast<bool>(m_handle));
        if (m_handle) {
            info["classifier"] = Json(m_handle->describe());
        }
        info["load_failed"] = Json(m_failed_stamp.has_value());
    }
    return Json(info);
}

RemoteClassifierProvider::RemoteClassifierProvider(std::string endpoint, std::string token, long timeout_ms)
    : m_endpoint(std::move(endpoint)), m_token(std::move(token)), m_timeout_ms(timeout_ms) {}

ClassifierPtr RemoteClassifierProvider::acquire() {
    if (m_token.empty() || m_endpoint.empty()) {
        return nullptr;
    }
    std::call_once(m_once, [this] {
        m_handle = make_remote_classifier(m_endpoint, m_token, m_timeout_ms);
        log_line(LogLevel::Info, kComponent, "using " + m_handle->describe());
    });
    return m_handle;
}

Json RemoteClassifierProvider::describe() const {
    JsonObject info;
    info["backend"] = Json("remote");
    info["endpoint"] = Json(m_endpoint);
    info["token_present"] = Json(!m_token.empty());
    info["timeout_ms"] = Json(static_cast<double>(m_timeout_ms));
    return Json(info);
}

ClassifierProviderPtr make_classifier_provider(const GateConfig& config) {
    switch (config.backend) {
    case BackendKind::Local:
        return std::make_shared<LocalClassifierProvider>(config.artifact_path());
    case BackendKind::Remote:
        return std::make_shared<RemoteClassifierProvider>(config.remote_endpoint, config.remote_token, config.remote_timeout_ms);
    }
    throw std::runtime_error("unknown classifier backend");
}

} // namespace promptgate
