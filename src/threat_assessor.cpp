#include "threat_assessor.hpp"

#include <algorithm>
#include <cmath>

namespace aegis {

namespace {

const ThreatLevelInfo kCritical{"CRITICAL THREAT",
                                "High-risk military target(s) detected. Immediate action required.",
                                "#ff1744", "☢"};
const ThreatLevelInfo kHigh{"HIGH ALERT",
                            "Multiple concerning objects detected in the area.",
                            "#ff6d00", "⚠"};
const ThreatLevelInfo kElevated{"ELEVATED RISK",
                                "Suspicious activity or equipment detected. Monitor closely.",
                                "#ffd600", "\U0001F536"};
const ThreatLevelInfo kLow{"LOW RISK",
                           "No immediate threats detected. Routine surveillance.",
                           "#00e676", "✔"};
const ThreatLevelInfo kClear{"ALL CLEAR",
                             "No objects detected in image.",
                             "#40c4ff", "✔"};

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

}  // namespace

const ThreatLevelInfo& threat_level_info(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::CRITICAL: return kCritical;
        case ThreatLevel::HIGH: return kHigh;
        case ThreatLevel::ELEVATED: return kElevated;
        case ThreatLevel::LOW: return kLow;
        default: return kClear;
    }
}

ThreatLevel threat_level_for(int total, int high_count, int medium_count) {
    if (total == 0) return ThreatLevel::CLEAR;
    if (high_count >= 2) return ThreatLevel::CRITICAL;
    if (high_count == 1) return ThreatLevel::HIGH;
    if (medium_count >= 2) return ThreatLevel::ELEVATED;
    return ThreatLevel::LOW;
}

DetectionStats compute_stats(const std::vector<Detection>& detections) {
    DetectionStats stats;
    if (detections.empty()) return stats;

    double sum = 0.0;
    double max_conf = 0.0;
    for (const auto& d : detections) {
        switch (d.risk) {
            case RiskTier::HIGH: stats.high_risk++; break;
            case RiskTier::MEDIUM: stats.medium_risk++; break;
            default: stats.low_risk++; break;
        }
        stats.class_counts[d.class_name]++;
        sum += d.confidence;
        max_conf = std::max(max_conf, static_cast<double>(d.confidence));
    }
    stats.total = static_cast<int>(detections.size());
    stats.avg_confidence = round4(sum / static_cast<double>(detections.size()));
    stats.max_confidence = round4(max_conf);
    return stats;
}

ThreatReport assess_threat(const std::vector<Detection>& detections) {
    ThreatReport report;
    report.stats = compute_stats(detections);

    for (const auto& d : detections) {
        if (d.risk == RiskTier::HIGH) report.high_risk_hits.push_back(d.class_name);
    }

    report.level = threat_level_for(report.stats.total, report.stats.high_risk, report.stats.medium_risk);
    const ThreatLevelInfo& info = threat_level_info(report.level);
    report.label = info.label;
    report.description = info.description;
    report.color = info.color;
    report.icon = info.icon;
    return report;
}

}  // namespace aegis
