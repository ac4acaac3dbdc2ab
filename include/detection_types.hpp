#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace aegis {

enum class RiskTier { HIGH, MEDIUM, LOW };

inline std::string risk_tier_to_string(RiskTier tier) {
    switch (tier) {
        case RiskTier::HIGH: return "high";
        case RiskTier::MEDIUM: return "medium";
        default: return "low";
    }
}

// Rendering priority: most dangerous first.
inline int risk_priority(RiskTier tier) {
    switch (tier) {
        case RiskTier::HIGH: return 0;
        case RiskTier::MEDIUM: return 1;
        default: return 2;
    }
}

struct BoundingBox {
    int x1{0};
    int y1{0};
    int x2{0};
    int y2{0};

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    int cx() const { return (x1 + x2) / 2; }
    int cy() const { return (y1 + y2) / 2; }

    cv::Rect rect() const { return cv::Rect(cv::Point(x1, y1), cv::Point(x2, y2)); }

    bool operator==(const BoundingBox& o) const {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
};

struct Detection {
    int index{0};                  // position in the raw detector output
    std::string class_name;
    float confidence{0.0f};        // [0, 1], rounded to 4 decimals
    RiskTier risk{RiskTier::LOW};
    BoundingBox box;

    bool operator==(const Detection& o) const {
        return index == o.index && class_name == o.class_name && confidence == o.confidence &&
               risk == o.risk && box == o.box;
    }
};

// One instance exactly as the detector produced it, in source-image pixels.
struct RawInstance {
    float x1{0.0f};
    float y1{0.0f};
    float x2{0.0f};
    float y2{0.0f};
    float confidence{0.0f};
    int class_id{-1};
};

struct RawDetections {
    std::vector<RawInstance> instances;
    std::map<int, std::string> class_names;
};

enum class ThreatLevel { CLEAR, LOW, ELEVATED, HIGH, CRITICAL };

inline std::string threat_level_to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::CRITICAL: return "CRITICAL";
        case ThreatLevel::HIGH: return "HIGH";
        case ThreatLevel::ELEVATED: return "ELEVATED";
        case ThreatLevel::LOW: return "LOW";
        default: return "CLEAR";
    }
}

inline std::optional<ThreatLevel> threat_level_from_string(const std::string& s) {
    if (s == "CRITICAL") return ThreatLevel::CRITICAL;
    if (s == "HIGH") return ThreatLevel::HIGH;
    if (s == "ELEVATED") return ThreatLevel::ELEVATED;
    if (s == "LOW") return ThreatLevel::LOW;
    if (s == "CLEAR") return ThreatLevel::CLEAR;
    return std::nullopt;
}

struct DetectionStats {
    int total{0};
    int high_risk{0};
    int medium_risk{0};
    int low_risk{0};
    double avg_confidence{0.0};
    double max_confidence{0.0};
    std::map<std::string, int> class_counts;
};

struct ThreatReport {
    ThreatLevel level{ThreatLevel::CLEAR};
    std::string label;
    std::string description;
    std::string color;
    std::string icon;
    std::vector<std::string> high_risk_hits;
    DetectionStats stats;
};

}  // namespace aegis
