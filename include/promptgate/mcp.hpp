#pragma once

#include "json.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace promptgate {

class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    int code() const noexcept { return m_code; }

private:
    int m_code;
};

// Line-delimited JSON-RPC 2.0 framing.
class MCPBridge {
public:
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;

    struct Request {
        Json id;
        std::string method;
        Json params;
        // No id member: the caller expects no reply.
        bool notification = false;
    };

    // Throws RpcError when the line is not a well-formed request.
    Request parse_request(const std::string& line) const;

    void send_response(std::ostream& out, const Json& id, const Json& result) const;
    void send_error(std::ostream& out, const Json& id, int code, const std::string& message) const;
};

} // namespace promptgate
