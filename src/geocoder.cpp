#include "geocoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "url_utils.hpp"

namespace aegis {

std::string format_coordinates(double lat, double lon) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%.4f\xC2\xB0 %c, %.4f\xC2\xB0 %c",
                  std::fabs(lat), lat >= 0 ? 'N' : 'S',
                  std::fabs(lon), lon >= 0 ? 'E' : 'W');
    return buf;
}

std::string place_name_from_nominatim(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};

    if (j.contains("address") && j["address"].is_object()) {
        const auto& addr = j["address"];
        std::vector<std::string> parts;
        for (const char* key : {"city", "town", "village", "county", "state", "country"}) {
            auto it = addr.find(key);
            if (it == addr.end() || !it->is_string()) continue;
            auto value = it->get<std::string>();
            if (std::find(parts.begin(), parts.end(), value) == parts.end()) parts.push_back(value);
        }
        if (!parts.empty()) {
            std::string out;
            for (size_t i = 0; i < parts.size() && i < 3; ++i) {
                if (i) out += ", ";
                out += parts[i];
            }
            return out;
        }
    }
    return j.value("display_name", std::string{});
}

NominatimGeocoder::NominatimGeocoder(std::string base_url, int timeout_sec)
    : timeout_sec_(timeout_sec) {
    auto parts = split_base_url(base_url);
    origin_ = parts.first;
    prefix_ = parts.second;
}

std::string NominatimGeocoder::reverse(double lat, double lon) {
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
        std::cerr << "[WARN] Invalid GPS coordinates: lat=" << lat << ", lon=" << lon << std::endl;
        return format_coordinates(lat, lon);
    }
    try {
        httplib::Client cli(origin_);
        cli.set_connection_timeout(timeout_sec_, 0);
        cli.set_read_timeout(timeout_sec_, 0);

        char query[160];
        std::snprintf(query, sizeof(query), "/reverse?format=json&lat=%.6f&lon=%.6f&accept-language=en", lat, lon);
        httplib::Headers headers{{"User-Agent", "aegis-geo-intel/1.0"}};

        auto res = cli.Get(prefix_ + query, headers);
        if (!res) {
            std::cerr << "[WARN] Geocoding failed: " << httplib::to_string(res.error()) << std::endl;
            return format_coordinates(lat, lon);
        }
        if (res->status != 200) {
            std::cerr << "[WARN] Geocoding failed: HTTP " << res->status << std::endl;
            return format_coordinates(lat, lon);
        }
        auto name = place_name_from_nominatim(res->body);
        if (name.empty()) return format_coordinates(lat, lon);
        return name;
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Geocoding failed: " << e.what() << std::endl;
        return format_coordinates(lat, lon);
    }
}

}  // namespace aegis
