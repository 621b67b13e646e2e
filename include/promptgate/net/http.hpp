#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace promptgate::net {

enum class HttpFailure {
    Transport,
    Timeout,
    Unauthorized,
    Status
};

const char* http_failure_name(HttpFailure failure) noexcept;

// Maps a non-2xx response status to the failure it reports.
HttpFailure classify_status(long status) noexcept;

class HttpError : public std::runtime_error {
public:
    HttpError(HttpFailure failure, long status, const std::string& message)
        : std::runtime_error(message), m_failure(failure), m_status(status) {}

    HttpFailure failure() const noexcept { return m_failure; }
    // Zero when no response was received.
    long status() const noexcept { return m_status; }

private:
    HttpFailure m_failure;
    long m_status;
};

using Headers = std::vector<std::pair<std::string, std::string>>;

// POSTs a JSON body and returns the response body of a 2xx reply. Throws
// HttpError for transport errors, timeouts and any other status.
std::string post_json(const std::string& url, const std::string& body, const Headers& headers, long timeout_ms);

} // namespace promptgate::net
