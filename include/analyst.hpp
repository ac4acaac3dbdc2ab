#pragma once

#include <string>
#include <vector>

#include "detection_types.hpp"
#include "llm_client.hpp"
#include "scan_artifact_store.hpp"

namespace aegis {

struct SitrepResult {
    bool success{false};
    std::string sitrep;
    std::string model;
    int tokens{0};
    std::string error;
};

struct ChatResult {
    bool success{false};
    std::string answer;
    int tokens{0};
    std::string error;
};

// Plain-text summary of one scan, fed to the LLM and kept with the artifact.
std::string build_detection_context(const std::vector<Detection>& detections,
                                    const ThreatReport& report,
                                    int width, int height,
                                    double inference_ms);

// "top-left" ... "bottom-right", or "center"; thirds split at 0.33 / 0.67.
std::string frame_position(int cx, int cy, int width, int height);

const std::string& analyst_system_prompt();

// Tactical analyst on top of an LlmClient. With no client it is disabled and
// every call returns success=false with disabled_reason. Never throws.
class Analyst {
public:
    Analyst(LlmClient* client, std::string disabled_reason);

    bool enabled() const { return client_ != nullptr; }
    const std::string& disabled_reason() const { return disabled_reason_; }

    SitrepResult generate_sitrep(const std::string& detection_context);

    // The caller persists the user and assistant turns on success.
    ChatResult chat(const std::string& scan_id, const std::string& message, const ScanArtifact& artifact);

private:
    LlmClient* client_;
    std::string disabled_reason_;
};

}  // namespace aegis
