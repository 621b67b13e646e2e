#include "../../include/promptgate/net/http.hpp"

#include <curl/curl.h>

#include <memory>
#include <sstream>

namespace promptgate::net {

namespace {

constexpr std::size_t kMaxErrorBody = 200;

class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw HttpError(HttpFailure::Transport, 0, "[http] curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

void append_header(HeaderList& list, const std::string& line) {
    curl_slist* grown = curl_slist_append(list.get(), line.c_str());
    if (!grown) {
        throw HttpError(HttpFailure::Transport, 0, "[http] unable to build request headers");
    }
    list.release();
    list.reset(grown);
}

} // namespace

const char* http_failure_name(HttpFailure failure) noexcept {
    switch (failure) {
    case HttpFailure::Transport: return "transport";
    case HttpFailure::Timeout: return "timeout";
    case HttpFailure::Unauthorized: return "unauthorized";
    case HttpFailure::Status: return "status";
    }
    return "transport";
}

HttpFailure classify_status(long status) noexcept {
    if (status == 401 || status == 403) {
        return HttpFailure::Unauthorized;
    }
    if (status == 408 || status == 504) {
        return HttpFailure::Timeout;
    }
    return HttpFailure::Status;
}

std::string post_json(const std::string& url, const std::string& body, const Headers& headers, long timeout_ms) {
    static CurlGlobal global;
    (void)global;

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw HttpError(HttpFailure::Transport, 0, "[http] curl_easy_init failed");
    }

    HeaderList header_list;
    append_header(header_list, "Content-Type: application/json");
    append_header(header_list, "Accept: application/json");
    for (const auto& header : headers) {
        append_header(header_list, header.first + ": " + header.second);
    }

    std::string response;
    CURL* easy = handle.get();
    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_POST, 1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(easy, CURLOPT_USERAGENT, "promptgate/0.1");
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms > 0) {
        curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    }

    const CURLcode code = curl_easy_perform(easy);
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed: " << curl_easy_strerror(code);
        const HttpFailure failure = code == CURLE_OPERATION_TIMEDOUT ? HttpFailure::Timeout : HttpFailure::Transport;
        throw HttpError(failure, 0, oss.str());
    }

    long status = 0;
    curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " returned " << status;
        if (!response.empty()) {
            oss << ": " << response.substr(0, kMaxErrorBody);
        }
        throw HttpError(classify_status(status), status, oss.str());
    }
    return response;
}

} // namespace promptgate::net
