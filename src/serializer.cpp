#include "../include/promptgate/serializer.hpp"

namespace promptgate {

std::string serialize_payload(const Json& payload) {
    return payload.dump();
}

} // namespace promptgate
