#include "../include/promptgate/serve.hpp"
#include "../include/promptgate/log.hpp"

#include <iterator>
#include <sstream>
#include <string>
#include <utility>

namespace promptgate {

namespace {

constexpr const char* kComponent = "service";

const Json& require_payload(const MCPBridge::Request& request) {
    if (!request.params.is_object()) {
        throw RpcError(MCPBridge::kInvalidParams, request.method + " expects an object with a payload field");
    }
    const auto& params = request.params.as_object();
    const auto it = params.find("payload");
    if (it == params.end()) {
        throw RpcError(MCPBridge::kInvalidParams, request.method + " requires params.payload");
    }
    return it->second;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

Service::Service(ResponseGate& gate, MCPBridge bridge)
    : m_gate(&gate), m_bridge(std::move(bridge)) {}

void Service::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) {
            continue;
        }
        Json id;
        bool notification = false;
        try {
            const MCPBridge::Request request = m_bridge.parse_request(line);
            id = request.id;
            notification = request.notification;
            Json result = handle_request(request);
            if (!notification) {
                m_bridge.send_response(out, id, result);
            }
        } catch (const RpcError& ex) {
            if (notification) {
                log_line(LogLevel::Warn, kComponent, std::string("notification dropped: ") + ex.what());
            } else {
                m_bridge.send_error(out, id, ex.code(), ex.what());
            }
        } catch (const std::exception& ex) {
            log_line(LogLevel::Error, kComponent, std::string("request failed: ") + ex.what());
            if (!notification) {
                m_bridge.send_error(out, id, MCPBridge::kInternalError, ex.what());
            }
        }
        out.flush();
    }
    out.flush();
}

Json Service::handle_request(const MCPBridge::Request& request) {
    if (request.method == "gate.evaluate") {
        return m_gate->gate(require_payload(request));
    }
    if (request.method == "gate.inspect") {
        GateOutcome outcome = m_gate->inspect(require_payload(request));
        JsonObject result;
        result["decision"] = Json(verdict_name(outcome.decision.verdict));
        result["reason"] = Json(outcome.decision.reason);
        result["scorer"] = Json(scorer_state_name(outcome.scorer_state));
        result["score"] = outcome.decision.score ? Json(*outcome.decision.score) : Json(nullptr);
        result["fault"] = outcome.fault ? Json(classifier_fault_name(*outcome.fault)) : Json(nullptr);
        result["result"] = std::move(outcome.payload);
        return Json(result);
    }
    if (request.method == "gate.status") {
        return m_gate->status();
    }
    if (request.method == "gate.stats") {
        return m_gate->stats().to_json();
    }
    throw RpcError(MCPBridge::kMethodNotFound, "unknown method: " + request.method);
}

int Service::filter(std::istream& in, std::ostream& out) {
    const std::string document{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    Json payload;
    try {
        payload = Json::parse(document);
    } catch (const std::exception& ex) {
        log_line(LogLevel::Error, kComponent, std::string("input is not valid JSON: ") + ex.what());
        return 1;
    }
    GateOutcome outcome = m_gate->inspect(std::move(payload));
    if (outcome.decision.blocked()) {
        out << outcome.payload.dump() << '\n';
    } else {
        // The document as read, not a re-serialization of the parsed value.
        out << document;
    }
    out.flush();
    return 0;
}

} // namespace promptgate
