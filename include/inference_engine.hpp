#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>

#include "detector.hpp"

#ifdef AEGIS_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace aegis {

struct InferenceSettings {
    std::string model_path;
    std::string class_names_path;   // optional, one name per line
    int img_size{640};
    float conf_threshold{0.25f};
    float iou_threshold{0.45f};
    int max_detections{100};
    bool use_onnxruntime{true};
};

// Decodes one YOLO output tensor into boxes in frame pixels. Handles the
// channel-first [1, 4+C, N] layout (v8 and later, no objectness) and the
// row-major [1, N, 5+C] layout (v5). Applies the confidence threshold and
// per-class NMS, then keeps the max_detections strongest. Throws
// DetectorError on an unexpected tensor rank.
RawDetections decode_yolo_output(const float* data, const std::vector<int64_t>& shape, const cv::Size& frame,
                                 const InferenceSettings& settings, const std::map<int, std::string>& class_names);

// YOLO ONNX model behind the Detector interface. Runs through ONNX Runtime
// when compiled in and loadable, otherwise through OpenCV DNN.
class InferenceEngine : public Detector {
public:
    explicit InferenceEngine(const InferenceSettings& settings);

    bool ready() const override { return ready_; }
    RawDetections detect(const cv::Mat& bgr) override;
    std::string describe() const override;

    const std::map<int, std::string>& class_names() const { return class_names_; }

private:
    void load_class_names(const std::string& path);

    RawDetections run_opencv(const cv::Mat& frame);
#ifdef AEGIS_USE_ONNXRUNTIME
    RawDetections run_ort(const cv::Mat& frame);
#endif

    InferenceSettings settings_;
    std::map<int, std::string> class_names_;
    cv::dnn::Net net_;
    bool ready_{false};
    bool use_ort_{false};
    std::mutex forward_mu_;

#ifdef AEGIS_USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "aegis"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace aegis
