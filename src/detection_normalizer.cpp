#include "detection_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "risk_classifier.hpp"

namespace aegis {

namespace {

float round4(float v) {
    return static_cast<float>(std::round(static_cast<double>(v) * 10000.0) / 10000.0);
}

// Truncates toward zero. Values past +/-1e9 are pinned there so the cast stays defined.
int to_pixel(float v) {
    return static_cast<int>(std::clamp(v, -1e9f, 1e9f));
}

bool finite_box(const RawInstance& inst) {
    return std::isfinite(inst.x1) && std::isfinite(inst.y1) && std::isfinite(inst.x2) && std::isfinite(inst.y2);
}

std::string class_name_for(const RawDetections& raw, int class_id) {
    auto it = raw.class_names.find(class_id);
    if (it != raw.class_names.end()) return it->second;
    return "class_" + std::to_string(class_id);
}

}  // namespace

std::vector<Detection> normalize_detections(const RawDetections& raw, const RiskVocabulary& vocabulary) {
    std::vector<Detection> out;
    out.reserve(raw.instances.size());

    for (size_t i = 0; i < raw.instances.size(); ++i) {
        const RawInstance& inst = raw.instances[i];
        if (!finite_box(inst)) continue;

        BoundingBox box;
        box.x1 = to_pixel(inst.x1);
        box.y1 = to_pixel(inst.y1);
        box.x2 = to_pixel(inst.x2);
        box.y2 = to_pixel(inst.y2);
        if (box.x1 > box.x2) std::swap(box.x1, box.x2);
        if (box.y1 > box.y2) std::swap(box.y1, box.y2);

        Detection d;
        d.index = static_cast<int>(i);
        d.class_name = class_name_for(raw, inst.class_id);
        d.confidence = std::isnan(inst.confidence) ? 0.0f : round4(std::clamp(inst.confidence, 0.0f, 1.0f));
        d.risk = classify(d.class_name, vocabulary);
        d.box = box;
        out.push_back(std::move(d));
    }

    std::stable_sort(out.begin(), out.end(), [](const Detection& a, const Detection& b) {
        const int pa = risk_priority(a.risk);
        const int pb = risk_priority(b.risk);
        if (pa != pb) return pa < pb;
        return a.confidence > b.confidence;
    });
    return out;
}

}  // namespace aegis
