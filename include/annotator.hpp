#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "detection_types.hpp"

namespace aegis {

struct AnnotationStyle {
    double font_scale{0.4};
    int thickness{1};
};

// Scales with the shorter image side so labels stay legible at any resolution.
AnnotationStyle annotation_style(int width, int height);

cv::Scalar risk_color(RiskTier tier);

// "<class>  <NN%>"
std::string detection_caption(const Detection& d);

// Draws boxes and label pills on a copy of frame; frame itself is untouched.
cv::Mat annotate(const cv::Mat& frame, const std::vector<Detection>& detections);

// JPEG, quality 92. Returns false when OpenCV could not encode or write.
bool save_annotated(const cv::Mat& image, const std::string& path);

}  // namespace aegis
