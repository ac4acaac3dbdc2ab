#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analyst.hpp"
#include "detection_types.hpp"
#include "detector.hpp"
#include "event_log.hpp"
#include "geocoder.hpp"
#include "model_profile.hpp"
#include "scan_artifact_store.hpp"

namespace aegis {

// Rejected upload: nothing has been saved or logged.
class InputError : public std::runtime_error {
public:
    enum class Kind { EMPTY, UNSUPPORTED_TYPE, UNDECODABLE };

    InputError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

struct GeoInfo {
    double latitude{0.0};
    double longitude{0.0};
    std::string location_name;
    std::string maps_link;
};

struct ScanRequest {
    std::string filename;       // client-side name, used for the extension and stem
    std::string body;           // encoded image bytes
    std::optional<double> latitude;
    std::optional<double> longitude;
};

struct ScanResult {
    std::string scan_id;
    std::string stored_name;
    std::string original_path;
    std::string annotated_path;     // empty when the annotated image could not be written
    int width{0};
    int height{0};
    double inference_ms{0.0};
    std::vector<Detection> detections;
    ThreatReport threat;
    bool audit_logged{false};
    std::string audit_error;
    std::string detection_context;
    SitrepResult sitrep;
    std::optional<GeoInfo> geo;
};

const std::vector<std::string>& allowed_extensions();

// Case-insensitive check of the text after the last '.'.
bool allowed_extension(const std::string& filename);

// Keeps [A-Za-z0-9._-], maps anything else to '_', drops directories and
// leading dots.
std::string sanitize_filename(const std::string& filename);

// "<8 hex>_<stem up to 40 chars><.ext>"
std::string unique_filename(const std::string& filename);

// Text before the first '_' of a stored name.
std::string scan_id_from(const std::string& stored_name);

// One upload, end to end: validate, decode, detect, normalize, assess,
// annotate, log, enrich. Stateless apart from the shared log and store, so
// one instance serves concurrent requests.
class DetectionPipeline {
public:
    DetectionPipeline(Detector& detector,
                      RiskVocabulary vocabulary,
                      EventLog& log,
                      ScanArtifactStore& store,
                      Analyst& analyst,
                      Geocoder* geocoder,
                      std::string upload_dir);

    // Throws InputError for a bad upload and DetectorError when inference
    // fails; in both cases no log row is written.
    ScanResult process(const ScanRequest& request);

    const std::string& upload_dir() const { return upload_dir_; }

private:
    Detector& detector_;
    RiskVocabulary vocabulary_;
    EventLog& log_;
    ScanArtifactStore& store_;
    Analyst& analyst_;
    Geocoder* geocoder_;
    std::string upload_dir_;
};

nlohmann::json to_json(const Detection& d);
nlohmann::json to_json(const ThreatReport& report);
nlohmann::json to_json(const ScanResult& result, bool analyst_enabled);

}  // namespace aegis
