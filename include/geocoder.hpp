#pragma once

#include <string>

namespace aegis {

// "<|lat|>° N|S, <|lon|>° E|W" with four decimals.
std::string format_coordinates(double lat, double lon);

// Reverse geocoding collaborator. Implementations never throw; on any failure
// they return format_coordinates(lat, lon).
class Geocoder {
public:
    virtual ~Geocoder() = default;
    virtual std::string reverse(double lat, double lon) = 0;
};

// OpenStreetMap Nominatim /reverse over cpp-httplib.
class NominatimGeocoder : public Geocoder {
public:
    explicit NominatimGeocoder(std::string base_url = "https://nominatim.openstreetmap.org",
                               int timeout_sec = 5);

    std::string reverse(double lat, double lon) override;

private:
    std::string origin_;
    std::string prefix_;
    int timeout_sec_;
};

// Picks a short place name out of a Nominatim /reverse JSON body: the first
// three distinct of city, town, village, county, state, country, or
// display_name when none are present. Empty if the body has neither.
std::string place_name_from_nominatim(const std::string& body);

}  // namespace aegis
