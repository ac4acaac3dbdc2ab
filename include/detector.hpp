#pragma once

#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

#include "detection_types.hpp"

namespace aegis {

class DetectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The object-detection model, seen from the pipeline: image in, boxes out.
class Detector {
public:
    virtual ~Detector() = default;

    virtual bool ready() const = 0;

    // Throws DetectorError (or a cv::Exception) when inference fails.
    virtual RawDetections detect(const cv::Mat& bgr) = 0;

    virtual std::string describe() const = 0;
};

}  // namespace aegis
