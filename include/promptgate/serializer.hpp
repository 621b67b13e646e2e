#pragma once

#include "json.hpp"

#include <string>

namespace promptgate {

// Canonical text form of a response payload, as handed to the scorer.
// Deterministic: equal payloads always produce byte-identical text.
std::string serialize_payload(const Json& payload);

} // namespace promptgate
