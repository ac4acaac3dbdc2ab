#include "server_app.hpp"

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "json_utils.hpp"

namespace aegis {

namespace {

constexpr size_t kMaxUploadBytes = 16 * 1024 * 1024;
constexpr size_t kLogRows = 50;

void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(dump_json(body), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, nlohmann::json{{"success", false}, {"error", message}}, status);
}

std::string string_field(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<double> query_double(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) return std::nullopt;
    try {
        return std::stod(req.get_param_value(key));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

ServerApp::ServerApp(const AppConfig& cfg, ServerDeps deps) : cfg_(cfg), deps_(deps) {}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_) return;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    if (http_srv_) {
        http_srv_->stop();
    }
    if (http_thread_.joinable()) http_thread_.join();
    http_running_ = false;
}

void ServerApp::join() {
    if (http_thread_.joinable()) http_thread_.join();
}

void ServerApp::run_http() {
    std::cout << "[INFO] Listening on http://" << cfg_.host << ":" << cfg_.port << std::endl;
    if (!http_srv_->listen(cfg_.host.c_str(), cfg_.port)) {
        std::cerr << "[ERROR] Could not bind " << cfg_.host << ":" << cfg_.port << std::endl;
    }
    http_running_ = false;
}

void ServerApp::setup_routes() {
    using namespace std::placeholders;
    http_srv_->set_payload_max_length(kMaxUploadBytes);

    http_srv_->Post("/detect", std::bind(&ServerApp::handle_detect, this, _1, _2));
    http_srv_->Get("/logs", std::bind(&ServerApp::handle_logs, this, _1, _2));
    http_srv_->Get("/health", std::bind(&ServerApp::handle_health, this, _1, _2));
    http_srv_->Get("/api/dashboard-data", std::bind(&ServerApp::handle_dashboard, this, _1, _2));
    http_srv_->Get("/api/export-csv", std::bind(&ServerApp::handle_export_csv, this, _1, _2));
    http_srv_->Get(R"(/api/sitrep/([0-9A-Za-z_-]+))", std::bind(&ServerApp::handle_sitrep, this, _1, _2));
    http_srv_->Post("/api/chat", std::bind(&ServerApp::handle_chat, this, _1, _2));

    if (!http_srv_->set_mount_point("/uploads", cfg_.upload_folder)) {
        std::cerr << "[WARN] Upload folder not mounted: " << cfg_.upload_folder << std::endl;
    }
    http_srv_->set_default_headers({{"Cache-Control", "no-store"}});
}

void ServerApp::handle_detect(const httplib::Request& req, httplib::Response& res) {
    ScanRequest scan;
    scan.filename = req.get_param_value("filename");
    scan.body = req.body;
    scan.latitude = query_double(req, "lat");
    scan.longitude = query_double(req, "lon");

    try {
        auto result = deps_.pipeline.process(scan);
        send_json(res, to_json(result, deps_.analyst.enabled()));
    } catch (const InputError& e) {
        send_error(res, e.kind() == InputError::Kind::UNSUPPORTED_TYPE ? 415 : 400, e.what());
    } catch (const DetectorError& e) {
        std::cerr << "[ERROR] Detection failed for " << scan.filename << ": " << e.what() << std::endl;
        send_error(res, 500, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] /detect: " << e.what() << std::endl;
        send_error(res, 500, e.what());
    }
}

void ServerApp::handle_logs(const httplib::Request&, httplib::Response& res) {
    try {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : deps_.log.read_recent(kLogRows)) rows.push_back(row_to_json(row));
        send_json(res, nlohmann::json{{"success", true}, {"logs", rows}});
    } catch (const std::exception& e) {
        std::cerr << "[WARN] /logs: " << e.what() << std::endl;
        send_error(res, 500, e.what());
    }
}

void ServerApp::handle_health(const httplib::Request&, httplib::Response& res) {
    send_json(res, nlohmann::json{
                       {"status", "ok"},
                       {"model_ready", deps_.detector.ready()},
                       {"model", deps_.detector.describe()},
                       {"analyst_enabled", deps_.analyst.enabled()},
                   });
}

void ServerApp::handle_dashboard(const httplib::Request&, httplib::Response& res) {
    auto snapshot = deps_.analytics.compute(deps_.log);
    send_json(res, nlohmann::json{{"success", true}, {"data", to_json(snapshot)}});
}

void ServerApp::handle_export_csv(const httplib::Request&, httplib::Response& res) {
    std::ifstream f(deps_.log.path(), std::ios::binary);
    if (!f) {
        send_error(res, 404, "No log file found");
        return;
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    res.set_header("Content-Disposition", "attachment; filename=\"aegis_detections.csv\"");
    res.set_content(oss.str(), "text/csv");
}

void ServerApp::handle_sitrep(const httplib::Request& req, httplib::Response& res) {
    const std::string scan_id = req.matches[1];
    auto artifact = deps_.store.get(scan_id);
    if (!artifact) {
        send_error(res, 404, "SITREP not found");
        return;
    }
    send_json(res, nlohmann::json{
                       {"success", true},
                       {"scan_id", scan_id},
                       {"sitrep", artifact->sitrep},
                       {"model", artifact->meta.model},
                       {"tokens", artifact->meta.tokens},
                       {"timestamp", artifact->timestamp},
                   });
}

void ServerApp::handle_chat(const httplib::Request& req, httplib::Response& res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        send_error(res, 400, "No JSON data provided");
        return;
    }
    const auto scan_id = string_field(body, "scan_id");
    const auto message = string_field(body, "message");
    if (scan_id.empty() || message.empty()) {
        send_error(res, 400, "Missing scan_id or message");
        return;
    }

    auto artifact = deps_.store.get(scan_id);
    if (!artifact) {
        send_error(res, 404, "Scan not found");
        return;
    }

    auto reply = deps_.analyst.chat(scan_id, message, *artifact);
    if (reply.success && !deps_.store.append_chat_exchange(scan_id, message, reply.answer)) {
        std::cerr << "[WARN] Chat exchange for scan " << scan_id << " was not saved" << std::endl;
    }
    send_json(res, nlohmann::json{
                       {"success", reply.success},
                       {"answer", reply.answer},
                       {"tokens", reply.tokens},
                       {"error", reply.error},
                   });
}

}  // namespace aegis
