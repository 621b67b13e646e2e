#include "../include/promptgate/gate.hpp"
#include "../include/promptgate/gate_config.hpp"
#include "../include/promptgate/log.hpp"
#include "../include/promptgate/serve.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--filter]\n"
              << "  (no option)  serve gate.* JSON-RPC requests on stdin/stdout\n"
              << "  --filter     gate one JSON document from stdin and print the result\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace promptgate;

    bool filter_mode = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--filter") {
            filter_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        const GateConfig config = resolve_gate_config();
        set_log_level(config.log_level);

        PolicyConfig policy_config;
        policy_config.threshold = config.threshold;
        policy_config.block_message = config.block_message;
        policy_config.fail_open = config.fail_open;

        ResponseGate gate(make_classifier_provider(config), DecisionPolicy(policy_config), config.log_payloads);
        log_line(LogLevel::Info, "main", "starting with " + gate.status().dump());

        Service service(gate, MCPBridge{});
        if (filter_mode) {
            return service.filter(std::cin, std::cout);
        }
        service.run(std::cin, std::cout);
    } catch (const std::exception& ex) {
        log_line(LogLevel::Error, "main", ex.what());
        return 1;
    }
    return 0;
}
