#include "analyst.hpp"

#include <cctype>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <utility>

namespace aegis {

namespace {

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

}  // namespace

const std::string& analyst_system_prompt() {
    static const std::string prompt =
        "You are an AI Tactical Analyst embedded in AEGIS, a target detection and surveillance system. "
        "You read raw object-detection results for a single image scan and turn them into actionable "
        "intelligence for human operators.\n\n"
        "SITREP format:\n"
        "- One-sentence executive summary first.\n"
        "- Detected objects by risk level (HIGH, then MEDIUM, then LOW) with confidence and position when relevant.\n"
        "- A tactical recommendation when the threat level is ELEVATED or higher.\n"
        "- Under 200 words, present tense, active voice, direct and factual.\n\n"
        "For follow-up questions, reference specific detections from the scan, admit uncertainty when the data "
        "is insufficient, and never speculate beyond the data provided. You have no historical context beyond "
        "this scan.";
    return prompt;
}

std::string frame_position(int cx, int cy, int width, int height) {
    const char* h = cx < width * 0.33 ? "left" : (cx > width * 0.67 ? "right" : "center");
    const char* v = cy < height * 0.33 ? "top" : (cy > height * 0.67 ? "bottom" : "middle");
    if (std::string(v) == "middle" && std::string(h) == "center") return "center";
    return std::string(v) + "-" + h;
}

std::string build_detection_context(const std::vector<Detection>& detections,
                                    const ThreatReport& report,
                                    int width, int height,
                                    double inference_ms) {
    std::ostringstream os;
    os << "IMAGE SCAN ANALYSIS\n";
    os << "Resolution: " << width << "x" << height << " pixels\n";
    os << "Inference time: " << fixed(inference_ms, 1) << "ms\n\n";

    os << "THREAT ASSESSMENT:\n";
    os << "  Level: " << threat_level_to_string(report.level) << "\n";
    os << "  Label: " << report.label << "\n";
    os << "  Description: " << report.description << "\n";
    os << "  Total detections: " << report.stats.total << "\n";
    os << "  High-risk: " << report.stats.high_risk << "\n";
    os << "  Medium-risk: " << report.stats.medium_risk << "\n";
    os << "  Low-risk: " << report.stats.low_risk << "\n\n";

    if (detections.empty()) {
        os << "DETECTED OBJECTS: None";
        return os.str();
    }

    os << "DETECTED OBJECTS (" << detections.size() << " total):";
    int n = 1;
    for (const auto& d : detections) {
        os << "\n  " << n++ << ". " << upper(d.class_name) << " [" << upper(risk_tier_to_string(d.risk)) << " RISK]";
        os << "\n     Confidence: " << fixed(d.confidence * 100.0, 1) << "%";
        os << "\n     Position: " << frame_position(d.box.cx(), d.box.cy(), width, height) << " of frame";
        os << "\n     Size: " << d.box.width() << "x" << d.box.height() << " pixels";
    }
    return os.str();
}

Analyst::Analyst(LlmClient* client, std::string disabled_reason)
    : client_(client), disabled_reason_(std::move(disabled_reason)) {
    if (!client_ && disabled_reason_.empty()) disabled_reason_ = "AI Analyst disabled";
}

SitrepResult Analyst::generate_sitrep(const std::string& detection_context) {
    SitrepResult out;
    if (!client_) {
        out.error = disabled_reason_;
        return out;
    }
    try {
        std::cout << "[INFO] Generating SITREP with " << client_->model() << std::endl;
        auto resp = client_->generate(analyst_system_prompt(),
                                      "Generate a tactical SITREP for this detection scan:\n\n" + detection_context,
                                      {});
        out.success = true;
        out.sitrep = resp.text;
        out.model = resp.model;
        out.tokens = resp.tokens_used;
        std::cout << "[INFO] SITREP generated (" << resp.tokens_used << " tokens)" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] LLM error: " << e.what() << std::endl;
        out.error = std::string("LLM error: ") + e.what();
    }
    return out;
}

ChatResult Analyst::chat(const std::string& scan_id, const std::string& message, const ScanArtifact& artifact) {
    ChatResult out;
    if (!client_) {
        out.error = disabled_reason_;
        return out;
    }

    std::string system = analyst_system_prompt();
    system += "\n\nCURRENT SCAN CONTEXT (Scan ID: " + scan_id + "):\n\n" + artifact.detection_context;
    system += "\n\nPREVIOUSLY GENERATED SITREP:\n" + artifact.sitrep;
    system += "\n\nThe operator is asking follow-up questions about this scan. Be concise and tactical.";

    std::vector<LlmMessage> history;
    history.reserve(artifact.chat_history.size());
    for (const auto& turn : artifact.chat_history) history.push_back(LlmMessage{turn.role, turn.content});

    try {
        std::cout << "[INFO] Processing chat question for scan " << scan_id << std::endl;
        auto resp = client_->generate(system, message, history);
        out.success = true;
        out.answer = resp.text;
        out.tokens = resp.tokens_used;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] LLM error in chat: " << e.what() << std::endl;
        out.error = std::string("LLM error: ") + e.what();
    }
    return out;
}

}  // namespace aegis
