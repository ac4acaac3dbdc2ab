#include "annotator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace aegis {

namespace {
const cv::Scalar kHighColor(0, 0, 255);
const cv::Scalar kMediumColor(0, 140, 255);
const cv::Scalar kLowColor(0, 200, 80);
const cv::Scalar kTextColor(255, 255, 255);
const int kFont = cv::FONT_HERSHEY_SIMPLEX;
}  // namespace

AnnotationStyle annotation_style(int width, int height) {
    const int short_side = std::min(width, height);
    AnnotationStyle style;
    style.font_scale = std::max(0.4, short_side / 1200.0);
    style.thickness = std::max(1, short_side / 400);
    return style;
}

cv::Scalar risk_color(RiskTier tier) {
    switch (tier) {
        case RiskTier::HIGH: return kHighColor;
        case RiskTier::MEDIUM: return kMediumColor;
        default: return kLowColor;
    }
}

std::string detection_caption(const Detection& d) {
    const int pct = static_cast<int>(std::lround(d.confidence * 100.0));
    return d.class_name + "  " + std::to_string(pct) + "%";
}

cv::Mat annotate(const cv::Mat& frame, const std::vector<Detection>& detections) {
    cv::Mat out = frame.clone();
    if (out.empty()) return out;

    const AnnotationStyle style = annotation_style(out.cols, out.rows);

    for (const auto& d : detections) {
        const cv::Scalar color = risk_color(d.risk);
        cv::rectangle(out, cv::Point(d.box.x1, d.box.y1), cv::Point(d.box.x2, d.box.y2),
                      color, style.thickness + 1);

        const std::string caption = detection_caption(d);
        int baseline = 0;
        const cv::Size text = cv::getTextSize(caption, kFont, style.font_scale, style.thickness, &baseline);

        // Pill sits above the box, clamped to the top edge.
        const int pill_y1 = std::max(d.box.y1 - text.height - baseline - 6, 0);
        const int pill_y2 = std::max(d.box.y1, text.height + baseline + 6);
        cv::rectangle(out, cv::Point(d.box.x1, pill_y1), cv::Point(d.box.x1 + text.width + 8, pill_y2),
                      color, cv::FILLED);
        cv::putText(out, caption, cv::Point(d.box.x1 + 4, pill_y2 - baseline - 2),
                    kFont, style.font_scale, kTextColor, style.thickness, cv::LINE_AA);
    }
    return out;
}

bool save_annotated(const cv::Mat& image, const std::string& path) {
    try {
        return cv::imwrite(path, image, {cv::IMWRITE_JPEG_QUALITY, 92});
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Could not write annotated image " << path << ": " << e.what() << std::endl;
        return false;
    }
}

}  // namespace aegis
