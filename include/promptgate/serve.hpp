#pragma once

#include "gate.hpp"
#include "mcp.hpp"

#include <istream>
#include <ostream>

namespace promptgate {

class Service {
public:
    Service(ResponseGate& gate, MCPBridge bridge);

    // Serves requests until the input stream ends.
    void run(std::istream& in, std::ostream& out);

    // Gates a single JSON document read from the stream. An allowed document
    // is echoed byte for byte.
    int filter(std::istream& in, std::ostream& out);

private:
    ResponseGate* m_gate;
    MCPBridge m_bridge;

    Json handle_request(const MCPBridge::Request& request);
};

} // namespace promptgate
