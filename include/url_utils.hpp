#pragma once

#include <string>
#include <utility>

namespace aegis {

// Splits "https://host[:port]/prefix" into ("https://host[:port]", "/prefix"),
// the form cpp-httplib's Client and its request paths take. Trailing slashes
// are dropped from the prefix.
std::pair<std::string, std::string> split_base_url(const std::string& url);

}  // namespace aegis
