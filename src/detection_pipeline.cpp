#include "detection_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "annotator.hpp"
#include "detection_normalizer.hpp"
#include "threat_assessor.hpp"

namespace fs = std::filesystem;

namespace aegis {

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

std::string random_hex8() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 0xffffffffu);
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
    return buf;
}

}  // namespace

const std::vector<std::string>& allowed_extensions() {
    static const std::vector<std::string> exts = {"png", "jpg", "jpeg", "gif", "bmp", "webp", "tiff"};
    return exts;
}

bool allowed_extension(const std::string& filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos) return false;
    const auto ext = lower(filename.substr(dot + 1));
    const auto& exts = allowed_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

std::string sanitize_filename(const std::string& filename) {
    auto slash = filename.find_last_of("/\\");
    std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back(std::isalnum(uc) || c == '.' || c == '_' || c == '-' ? c : '_');
    }
    const auto first = out.find_first_not_of("._");
    return first == std::string::npos ? std::string{} : out.substr(first);
}

std::string unique_filename(const std::string& filename) {
    const auto clean = sanitize_filename(filename);
    const auto dot = clean.rfind('.');
    std::string stem = dot == std::string::npos ? clean : clean.substr(0, dot);
    std::string ext = dot == std::string::npos ? std::string{} : clean.substr(dot);
    if (stem.size() > 40) stem.resize(40);
    return random_hex8() + "_" + stem + ext;
}

std::string scan_id_from(const std::string& stored_name) {
    return stored_name.substr(0, stored_name.find('_'));
}

DetectionPipeline::DetectionPipeline(Detector& detector,
                                     RiskVocabulary vocabulary,
                                     EventLog& log,
                                     ScanArtifactStore& store,
                                     Analyst& analyst,
                                     Geocoder* geocoder,
                                     std::string upload_dir)
    : detector_(detector),
      vocabulary_(std::move(vocabulary)),
      log_(log),
      store_(store),
      analyst_(analyst),
      geocoder_(geocoder),
      upload_dir_(std::move(upload_dir)) {
    std::error_code ec;
    fs::create_directories(upload_dir_, ec);
    if (ec) std::cerr << "[WARN] Could not create upload folder " << upload_dir_ << ": " << ec.message() << std::endl;
}

ScanResult DetectionPipeline::process(const ScanRequest& request) {
    if (request.filename.empty() || request.body.empty()) {
        throw InputError(InputError::Kind::EMPTY, "No image provided.");
    }
    if (!allowed_extension(request.filename)) {
        std::string accepted;
        for (const auto& e : allowed_extensions()) accepted += (accepted.empty() ? "" : ", ") + e;
        throw InputError(InputError::Kind::UNSUPPORTED_TYPE, "File type not allowed. Accepted: " + accepted);
    }

    std::vector<uchar> bytes(request.body.begin(), request.body.end());
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw InputError(InputError::Kind::UNDECODABLE, "Could not decode image: " + request.filename);
    }

    ScanResult result;
    result.stored_name = unique_filename(request.filename);
    result.scan_id = scan_id_from(result.stored_name);
    result.width = image.cols;
    result.height = image.rows;
    result.original_path = (fs::path(upload_dir_) / result.stored_name).string();

    {
        std::ofstream out(result.original_path, std::ios::binary);
        out.write(request.body.data(), static_cast<std::streamsize>(request.body.size()));
        if (!out) throw std::runtime_error("Could not save upload to " + result.original_path);
    }
    std::cout << "[INFO] Image saved: " << result.original_path << std::endl;

    if (request.latitude && request.longitude) {
        GeoInfo geo;
        geo.latitude = *request.latitude;
        geo.longitude = *request.longitude;
        geo.location_name = geocoder_ ? geocoder_->reverse(geo.latitude, geo.longitude)
                                      : format_coordinates(geo.latitude, geo.longitude);
        char link[128];
        std::snprintf(link, sizeof(link), "https://www.google.com/maps?q=%.6f,%.6f", geo.latitude, geo.longitude);
        geo.maps_link = link;
        result.geo = geo;
    }

    RawDetections raw;
    const auto t0 = std::chrono::steady_clock::now();
    try {
        raw = detector_.detect(image);
    } catch (const DetectorError&) {
        throw;
    } catch (const std::exception& e) {
        throw DetectorError(std::string("Detection failed: ") + e.what());
    }
    const auto t1 = std::chrono::steady_clock::now();
    result.inference_ms =
        std::round(std::chrono::duration<double, std::milli>(t1 - t0).count() * 10.0) / 10.0;

    result.detections = normalize_detections(raw, vocabulary_);
    result.threat = assess_threat(result.detections);

    const auto stem = fs::path(result.stored_name).stem().string();
    const auto annotated = (fs::path(upload_dir_) / ("annotated_" + stem + ".jpg")).string();
    if (save_annotated(annotate(image, result.detections), annotated)) {
        result.annotated_path = annotated;
    } else {
        std::cerr << "[WARN] Could not write annotated image " << annotated << std::endl;
    }

    try {
        log_.append(result.stored_name, result.threat, result.detections, result.inference_ms);
        result.audit_logged = true;
    } catch (const EventLogError& e) {
        result.audit_logged = false;
        result.audit_error = e.what();
        std::cerr << "[ERROR] Audit log write failed for " << result.stored_name << ": " << e.what() << std::endl;
    }

    result.detection_context = build_detection_context(result.detections, result.threat, result.width,
                                                       result.height, result.inference_ms);
    if (analyst_.enabled()) {
        result.sitrep = analyst_.generate_sitrep(result.detection_context);
        if (result.sitrep.success) {
            store_.create(result.scan_id, result.detection_context, result.sitrep.sitrep,
                          ModelMeta{result.sitrep.model, result.sitrep.tokens});
        }
    } else {
        result.sitrep.error = analyst_.disabled_reason();
    }

    std::cout << "[INFO] Scan " << result.scan_id << ": " << result.detections.size() << " detections, "
              << threat_level_to_string(result.threat.level) << ", " << result.inference_ms << " ms" << std::endl;
    return result;
}

nlohmann::json to_json(const Detection& d) {
    return nlohmann::json{
        {"index", d.index},
        {"class_name", d.class_name},
        {"confidence", round4(d.confidence)},
        {"risk_level", risk_tier_to_string(d.risk)},
        {"box",
         {{"x1", d.box.x1},
          {"y1", d.box.y1},
          {"x2", d.box.x2},
          {"y2", d.box.y2},
          {"width", d.box.width()},
          {"height", d.box.height()},
          {"cx", d.box.cx()},
          {"cy", d.box.cy()}}},
    };
}

nlohmann::json to_json(const ThreatReport& report) {
    nlohmann::json counts = nlohmann::json::object();
    for (const auto& kv : report.stats.class_counts) counts[kv.first] = kv.second;
    return nlohmann::json{
        {"threat_level", threat_level_to_string(report.level)},
        {"label", report.label},
        {"description", report.description},
        {"color", report.color},
        {"icon", report.icon},
        {"high_risk_hits", report.high_risk_hits},
        {"stats",
         {{"total", report.stats.total},
          {"high_risk", report.stats.high_risk},
          {"medium_risk", report.stats.medium_risk},
          {"low_risk", report.stats.low_risk},
          {"avg_confidence", report.stats.avg_confidence},
          {"max_confidence", report.stats.max_confidence},
          {"class_counts", counts}}},
    };
}

nlohmann::json to_json(const ScanResult& result, bool analyst_enabled) {
    nlohmann::json dets = nlohmann::json::array();
    for (const auto& d : result.detections) dets.push_back(to_json(d));

    nlohmann::json j{
        {"success", true},
        {"scan_id", result.scan_id},
        {"detections", dets},
        {"threat", to_json(result.threat)},
        {"original_path", "/uploads/" + result.stored_name},
        {"annotated_path",
         result.annotated_path.empty() ? std::string{}
                                       : "/uploads/" + fs::path(result.annotated_path).filename().string()},
        {"inference_ms", result.inference_ms},
        {"image_size", {{"width", result.width}, {"height", result.height}}},
        {"audit_logged", result.audit_logged},
        {"analyst_enabled", analyst_enabled},
        {"sitrep",
         {{"success", result.sitrep.success},
          {"sitrep", result.sitrep.sitrep},
          {"model", result.sitrep.model},
          {"tokens", result.sitrep.tokens},
          {"error", result.sitrep.error}}},
    };
    if (!result.audit_logged) j["audit_error"] = result.audit_error;
    if (result.geo) {
        j["geo"] = {
            {"latitude", result.geo->latitude},
            {"longitude", result.geo->longitude},
            {"location_name", result.geo->location_name},
            {"maps_link", result.geo->maps_link},
        };
    } else {
        j["geo"] = nullptr;
    }
    return j;
}

}  // namespace aegis
