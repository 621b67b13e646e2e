#include "../include/promptgate/mcp.hpp"

namespace promptgate {

MCPBridge::Request MCPBridge::parse_request(const std::string& line) const {
    Json parsed;
    try {
        parsed = Json::parse_exact(line);
    } catch (const JsonPrecisionError& ex) {
        throw RpcError(kInvalidParams, std::string("number would not pass through unchanged: ") + ex.what());
    } catch (const std::exception& ex) {
        throw RpcError(kParseError, std::string("parse error: ") + ex.what());
    }
    if (!parsed.is_object()) {
        throw RpcError(kInvalidRequest, "request must be a JSON object");
    }

    Request request;
    const auto& obj = parsed.as_object();
    if (auto it = obj.find("id"); it == obj.end()) {
        request.notification = true;
    } else if (it->second.is_string() || it->second.is_number()) {
        request.id = it->second;
    }
    if (auto it = obj.find("method"); it != obj.end() && it->second.is_string()) {
        request.method = it->second.as_string();
    } else {
        throw RpcError(kInvalidRequest, "request is missing a method");
    }
    if (auto it = obj.find("params"); it != obj.end()) {
        request.params = it->second;
    }
    return request;
}

void MCPBridge::send_response(std::ostream& out, const Json& id, const Json& result) const {
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["result"] = result;
    out << Json(obj).dump() << '\n';
}

void MCPBridge::send_error(std::ostream& out, const Json& id, int code, const std::string& message) const {
    JsonObject err;
    err["code"] = Json(code);
    err["message"] = Json(message);
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["error"] = Json(err);
    out << Json(obj).dump() << '\n';
}

} // namespace promptgate
