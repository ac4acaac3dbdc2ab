#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "llm_client.hpp"
#include "model_profile.hpp"

namespace aegis {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string host{"0.0.0.0"};
    int port{5000};

    ModelProfile model_profile{ModelProfile::AUTO};
    std::string models_dir{"models"};
    std::string model_path{};         // empty: resolved from the profile
    std::string class_names_path{};   // optional path to names file
    int img_size{640};
    float conf_threshold{0.25f};
    float iou_threshold{0.45f};
    int max_detections{100};
    bool use_ort{true};               // use ONNX Runtime when available

    std::string upload_folder{"uploads"};
    std::string log_path{"logs/detections.csv"};
    std::string sitrep_store_path{"logs/sitreps.json"};
    size_t sitrep_retain{0};          // 0: keep every artifact

    LlmSettings llm{};
    bool geocoder_enabled{true};
    std::string geocoder_url{"https://nominatim.openstreetmap.org"};

    int compact_days{0};              // > 0: compact the event log and exit
    std::vector<std::string> inputs;  // positional arguments

    bool analyst_enabled() const { return !llm.api_key.empty(); }
};

// Defaults, then environment variables, then command-line flags.
// Throws ConfigError on a malformed value.
AppConfig parse_args(int argc, char** argv);

}  // namespace aegis
