#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "analytics_engine.hpp"
#include "analyst.hpp"
#include "config.hpp"
#include "detection_pipeline.hpp"
#include "detector.hpp"
#include "event_log.hpp"
#include "scan_artifact_store.hpp"

namespace aegis {

// Components the HTTP layer hands requests to. All owned by main.
struct ServerDeps {
    Detector& detector;
    DetectionPipeline& pipeline;
    EventLog& log;
    AnalyticsEngine& analytics;
    ScanArtifactStore& store;
    Analyst& analyst;
};

class ServerApp {
public:
    ServerApp(const AppConfig& cfg, ServerDeps deps);
    ~ServerApp();

    void start();
    void stop();
    void join();

    bool running() const { return http_running_; }

private:
    void run_http();
    void setup_routes();

    void handle_detect(const httplib::Request& req, httplib::Response& res);
    void handle_logs(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_dashboard(const httplib::Request& req, httplib::Response& res);
    void handle_export_csv(const httplib::Request& req, httplib::Response& res);
    void handle_sitrep(const httplib::Request& req, httplib::Response& res);
    void handle_chat(const httplib::Request& req, httplib::Response& res);

    AppConfig cfg_;
    ServerDeps deps_;
    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

}  // namespace aegis
