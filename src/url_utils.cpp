#include "url_utils.hpp"

namespace aegis {

std::pair<std::string, std::string> split_base_url(const std::string& url) {
    const auto scheme = url.find("://");
    const size_t host_start = scheme == std::string::npos ? 0 : scheme + 3;
    const auto slash = url.find('/', host_start);
    if (slash == std::string::npos) return {url, ""};
    std::string prefix = url.substr(slash);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {url.substr(0, slash), prefix};
}

}  // namespace aegis
