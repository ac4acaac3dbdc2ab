#pragma once

#include <vector>

#include "detection_types.hpp"
#include "model_profile.hpp"

namespace aegis {

// Turns raw detector output into Detection records ordered most dangerous,
// most confident first. Equal tier and confidence keep detector order.
std::vector<Detection> normalize_detections(const RawDetections& raw, const RiskVocabulary& vocabulary);

}  // namespace aegis
