#include <chrono>
#include <iostream>
#include <memory>

#include "analytics_engine.hpp"
#include "analyst.hpp"
#include "config.hpp"
#include "detection_pipeline.hpp"
#include "event_log.hpp"
#include "geocoder.hpp"
#include "inference_engine.hpp"
#include "llm_client.hpp"
#include "scan_artifact_store.hpp"
#include "server_app.hpp"

int main(int argc, char** argv) {
    aegis::AppConfig cfg;
    try {
        cfg = aegis::parse_args(argc, argv);
    } catch (const aegis::ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << " (see --help)" << std::endl;
        return 2;
    }

    aegis::EventLog log(cfg.log_path);

    if (cfg.compact_days > 0) {
        const auto cutoff = aegis::Clock::now() - std::chrono::hours(24) * cfg.compact_days;
        try {
            const size_t removed = log.compact(cutoff);
            std::cout << "[INFO] Compacted " << cfg.log_path << ": removed " << removed
                      << " rows older than " << aegis::log_timestamp(cutoff) << std::endl;
            return 0;
        } catch (const aegis::EventLogError& e) {
            std::cerr << "[ERROR] Compaction failed: " << e.what() << std::endl;
            return 1;
        }
    }

    std::cout << "[INFO] Starting AEGIS detection server\n";
    std::cout << "       profile: " << aegis::model_profile_to_string(cfg.model_profile) << "\n";
    std::cout << "       model  : " << cfg.model_path << "\n";
    std::cout << "       log    : " << cfg.log_path << "\n";
    std::cout << "       ORT    : " << (cfg.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";

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
        std::cerr << "[WARN] Model not loaded; /detect will answer 500 until it is fixed" << std::endl;
    }

    const auto vocabulary = aegis::vocabulary_for(cfg.model_profile);

    aegis::ScanArtifactStore store(cfg.sitrep_store_path);
    if (cfg.sitrep_retain > 0) {
        const size_t evicted = store.retain_latest(cfg.sitrep_retain);
        if (evicted > 0) std::cout << "[INFO] Evicted " << evicted << " old scan artifacts" << std::endl;
    }

    std::unique_ptr<aegis::LlmClient> llm;
    std::string disabled_reason;
    if (cfg.analyst_enabled()) {
        llm = std::make_unique<aegis::HttpLlmClient>(cfg.llm);
    } else {
        disabled_reason = "AI Analyst disabled - " + aegis::llm_provider_to_string(cfg.llm.provider) +
                          " API key not configured";
        std::cout << "[INFO] " << disabled_reason << std::endl;
    }
    aegis::Analyst analyst(llm.get(), disabled_reason);

    std::unique_ptr<aegis::Geocoder> geocoder;
    if (cfg.geocoder_enabled) geocoder = std::make_unique<aegis::NominatimGeocoder>(cfg.geocoder_url);

    aegis::DetectionPipeline pipeline(engine, vocabulary, log, store, analyst, geocoder.get(), cfg.upload_folder);
    aegis::AnalyticsEngine analytics(vocabulary);

    aegis::ServerApp app(cfg, aegis::ServerDeps{engine, pipeline, log, analytics, store, analyst});
    app.start();
    app.join();
    std::cout << "[INFO] Server stopped" << std::endl;
    return 0;
}
