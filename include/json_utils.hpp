#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace aegis {

// Serializes for the wire or for disk. Invalid UTF-8 in any string (class
// names from a Latin-1 names file, old log rows) is replaced with U+FFFD
// instead of throwing.
std::string dump_json(const nlohmann::json& j, int indent = -1);

}  // namespace aegis
