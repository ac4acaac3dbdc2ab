#include <iostream>
#include <memory>
#include <ostream>

#include "analyst.hpp"
#include "batch_scan.hpp"
#include "config.hpp"
#include "detection_pipeline.hpp"
#include "event_log.hpp"
#include "inference_engine.hpp"
#include "llm_client.hpp"
#include "scan_artifact_store.hpp"

// Batch scan: runs every image named on the command line through the same
// pipeline the server uses. Stdout carries one JSON result per line; all
// logging goes to stderr.
int main(int argc, char** argv) {
    aegis::AppConfig cfg;
    try {
        cfg = aegis::parse_args(argc, argv);
    } catch (const aegis::ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << " (see --help)" << std::endl;
        return 2;
    }
    if (cfg.inputs.empty()) {
        std::cerr << "[ERROR] No input images given (see --help)" << std::endl;
        return 2;
    }

    std::ostream results(std::cout.rdbuf());
    aegis::CoutToCerr redirect;

    aegis::InferenceSettings settings;
    settings.model_path = cfg.model_path;
    settings.class_names_path = cfg.class_names_path;
    settings.img_size = cfg.img_size;
    settings.conf_threshold = cfg.conf_threshold;
    settings.iou_threshold = cfg.iou_threshold;
    settings.max_detections = cfg.max_detections;
    settings.use_onnxruntime = cfg.use_ort;
    aegis::InferenceEngine engine(settings);
    if (!engine.ready()) {
        std::cerr << "[ERROR] Model not loaded: " << cfg.model_path << std::endl;
        return 1;
    }

    aegis::EventLog log(cfg.log_path);
    aegis::ScanArtifactStore store(cfg.sitrep_store_path);

    std::unique_ptr<aegis::LlmClient> llm;
    if (cfg.analyst_enabled()) llm = std::make_unique<aegis::HttpLlmClient>(cfg.llm);
    aegis::Analyst analyst(llm.get(), "AI Analyst disabled - " + aegis::llm_provider_to_string(cfg.llm.provider) +
                                          " API key not configured");

    aegis::DetectionPipeline pipeline(engine, aegis::vocabulary_for(cfg.model_profile), log, store, analyst,
                                      nullptr, cfg.upload_folder);

    const int failures = aegis::run_batch_scan(cfg.inputs, pipeline, analyst.enabled(), results);
    return failures == 0 ? 0 : 1;
}
