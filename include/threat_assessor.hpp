#pragma once

#include <string>
#include <vector>

#include "detection_types.hpp"

namespace aegis {

struct ThreatLevelInfo {
    const char* label;
    const char* description;
    const char* color;
    const char* icon;
};

const ThreatLevelInfo& threat_level_info(ThreatLevel level);

ThreatLevel threat_level_for(int total, int high_count, int medium_count);

DetectionStats compute_stats(const std::vector<Detection>& detections);

// Pure aggregation: the same detections always produce the same report.
ThreatReport assess_threat(const std::vector<Detection>& detections);

}  // namespace aegis
