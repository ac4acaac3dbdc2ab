#include "inference_engine.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace aegis {

namespace {

const std::vector<std::string> kCocoNames = {
    "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
    "boat",   "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
    "bird",   "cat",           "dog",         "horse",     "sheep",         "cow",
    "elephant", "bear", "zebra", "giraffe", "backpack", "umbrella",
    "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
    "sports ball", "kite", "baseball bat", "baseball glove", "skateboard",
    "surfboard", "tennis racket", "bottle", "wine glass", "cup", "fork",
    "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
    "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
    "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop",
    "mouse", "remote", "keyboard", "cell phone", "microwave", "oven", "toaster",
    "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
    "hair drier", "toothbrush"};

struct Candidate {
    cv::Rect2d box;
    float score;
    int class_id;
};

}  // namespace

InferenceEngine::InferenceEngine(const InferenceSettings& settings)
    : settings_(settings), use_ort_(settings.use_onnxruntime) {
    if (!settings_.class_names_path.empty()) {
        load_class_names(settings_.class_names_path);
    }
    if (class_names_.empty()) {
        for (size_t i = 0; i < kCocoNames.size(); ++i) class_names_[static_cast<int>(i)] = kCocoNames[i];
    }

#ifdef AEGIS_USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, settings_.model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            ready_ = true;
            std::cout << "[INFO] Loaded ORT model: " << settings_.model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            session_.reset();
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            net_ = cv::dnn::readNet(settings_.model_path);
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            ready_ = !net_.empty();
            std::cout << "[INFO] Loaded OpenCV DNN model: " << settings_.model_path << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "[ERROR] Could not load model " << settings_.model_path << ": " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

void InferenceEngine::load_class_names(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[WARN] Unable to open class names file: " << path << std::endl;
        return;
    }
    std::string line;
    int id = 0;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) class_names_[id++] = line;
    }
}

std::string InferenceEngine::describe() const {
    return settings_.model_path + (use_ort_ ? " (onnxruntime)" : " (opencv-dnn)");
}

RawDetections InferenceEngine::detect(const cv::Mat& bgr) {
    if (!ready_) throw DetectorError("model not loaded: " + settings_.model_path);
    if (bgr.empty()) throw DetectorError("empty image");

    // cv::dnn::Net and Ort::Session::Run on one session are used from one thread at a time.
    std::lock_guard<std::mutex> lock(forward_mu_);
#ifdef AEGIS_USE_ONNXRUNTIME
    if (use_ort_ && session_) {
        return run_ort(bgr);
    }
#endif
    return run_opencv(bgr);
}

RawDetections decode_yolo_output(const float* data, const std::vector<int64_t>& shape, const cv::Size& frame,
                                 const InferenceSettings& settings, const std::map<int, std::string>& class_names) {
    RawDetections out;
    out.class_names = class_names;

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (shape.size() == 3) {
        rows = static_cast<int>(shape[1]);
        dims = static_cast<int>(shape[2]);
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
    } else if (shape.size() == 2) {
        rows = static_cast<int>(shape[0]);
        dims = static_cast<int>(shape[1]);
    } else {
        throw DetectorError("unexpected model output rank " + std::to_string(shape.size()));
    }

    // YOLOv8/11 exports [1, 4+C, N] without objectness; YOLOv5 exports [1, N, 5+C].
    const bool has_objectness =
        !channel_first && dims != static_cast<int>(class_names.size()) + 4;
    const int class_start = has_objectness ? 5 : 4;
    const int classes = std::max(1, dims - class_start);

    const float scale_x = static_cast<float>(frame.width) / static_cast<float>(settings.img_size);
    const float scale_y = static_cast<float>(frame.height) / static_cast<float>(settings.img_size);

    std::map<int, std::vector<Candidate>> by_class;
    for (int i = 0; i < rows; ++i) {
        const float* ptr = channel_first ? (data + i) : (data + static_cast<size_t>(i) * dims);
        auto item = [&](int idx) -> float {
            return channel_first ? ptr[static_cast<size_t>(idx) * rows] : ptr[idx];
        };

        int best_cls = -1;
        float best_score = 0.0f;
        const float objectness = has_objectness ? item(4) : 1.0f;
        for (int c = 0; c < classes && class_start + c < dims; ++c) {
            float conf = objectness * item(class_start + c);
            if (conf > best_score) {
                best_score = conf;
                best_cls = c;
            }
        }
        if (best_cls < 0 || best_score < settings.conf_threshold) continue;

        const float cx = item(0);
        const float cy = item(1);
        const float w = item(2);
        const float h = item(3);
        const float x0 = std::clamp((cx - 0.5f * w) * scale_x, 0.0f, static_cast<float>(frame.width));
        const float y0 = std::clamp((cy - 0.5f * h) * scale_y, 0.0f, static_cast<float>(frame.height));
        const float x1 = std::clamp((cx + 0.5f * w) * scale_x, 0.0f, static_cast<float>(frame.width));
        const float y1 = std::clamp((cy + 0.5f * h) * scale_y, 0.0f, static_cast<float>(frame.height));
        by_class[best_cls].push_back(Candidate{cv::Rect2d(x0, y0, x1 - x0, y1 - y0), best_score, best_cls});
    }

    // Per-class NMS, then the strongest max_detections overall.
    std::vector<Candidate> kept;
    for (const auto& entry : by_class) {
        const auto& cands = entry.second;
        std::vector<cv::Rect2d> boxes;
        std::vector<float> scores;
        for (const auto& c : cands) {
            boxes.push_back(c.box);
            scores.push_back(c.score);
        }
        std::vector<int> keep;
        cv::dnn::NMSBoxes(boxes, scores, settings.conf_threshold, settings.iou_threshold, keep);
        for (int idx : keep) kept.push_back(cands[idx]);
    }
    std::stable_sort(kept.begin(), kept.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (settings.max_detections > 0 && kept.size() > static_cast<size_t>(settings.max_detections)) {
        kept.resize(static_cast<size_t>(settings.max_detections));
    }

    out.instances.reserve(kept.size());
    for (const auto& c : kept) {
        RawInstance inst;
        inst.x1 = static_cast<float>(c.box.x);
        inst.y1 = static_cast<float>(c.box.y);
        inst.x2 = static_cast<float>(c.box.x + c.box.width);
        inst.y2 = static_cast<float>(c.box.y + c.box.height);
        inst.confidence = c.score;
        inst.class_id = c.class_id;
        out.instances.push_back(inst);
    }
    return out;
}

#ifdef AEGIS_USE_ONNXRUNTIME
RawDetections InferenceEngine::run_ort(const cv::Mat& frame) {
    const int size = settings_.img_size;
    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(size, size));
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(static_cast<size_t>(3) * size * size);
    std::vector<int64_t> input_shape{1, 3, size, size};
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < size; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < size; ++x) {
                blob.push_back(row[x * 3 + c]);
            }
        }
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                 input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());
    if (outputs.empty()) throw DetectorError("model produced no outputs");

    auto& out = outputs.front();
    const float* data = out.GetTensorData<float>();
    auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
    return decode_yolo_output(data, shape, frame.size(), settings_, class_names_);
}
#endif

RawDetections InferenceEngine::run_opencv(const cv::Mat& frame) {
    cv::Mat blob = cv::dnn::blobFromImage(frame, 1.0 / 255.0, cv::Size(settings_.img_size, settings_.img_size),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    std::vector<int64_t> shape;
    for (int i = 0; i < pred.dims; ++i) shape.push_back(pred.size[i]);
    if (!pred.isContinuous()) pred = pred.clone();
    return decode_yolo_output(reinterpret_cast<const float*>(pred.data), shape, frame.size(),
                              settings_, class_names_);
}

}  // namespace aegis
